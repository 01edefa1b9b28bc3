#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

/// @brief User-adjustable launcher settings, persisted as settings.json in the
/// state directory. Every key is optional; unknown or invalid values fall back
/// to the defaults below.
struct LauncherSettings
{
	double healthCheckInterval = 5.0;
	bool openBrowserOnStart = true;
	std::string dockerImage = "ghcr.io/openclaw/openclaw:latest";
	std::string memoryLimit = "2g";
	std::string cpuLimit = "2.0";
	uint16_t port = 18789;
	bool randomizePort = false;
	bool debugMode = false;

	static bool IsValidMemoryLimit(const std::string& value);
	static bool IsValidCpuLimit(const std::string& value);

	static LauncherSettings Load(const std::filesystem::path& file);
	void Save(const std::filesystem::path& file) const;

	bool operator==(const LauncherSettings&) const = default;
};

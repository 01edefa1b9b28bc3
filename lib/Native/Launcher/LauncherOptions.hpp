#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "Docker/DockerPaths.hpp"
#include "State/LauncherSettings.hpp"
#include "State/StatePaths.hpp"

struct LauncherOptions
{
	StatePaths Paths;
	DockerPaths::SearchConfig EngineSearch;
	LauncherSettings Settings;

	std::string ContainerName = "openclaw";
	std::string EngineBinary = "docker";
	uint16_t ContainerPort = 18789;
	std::string GatewayBasePath = "/openclaw";

	int EngineRetryCount = 45;
	std::chrono::milliseconds EngineRetryDelay{2000};
	int GatewayRetryCount = 30;
	std::chrono::milliseconds GatewayRetryDelay{1000};
	std::chrono::milliseconds HealthProbeTimeout{2000};
	int HealthFailureThreshold = 3;
	/// Floor for settings.healthCheckInterval.
	std::chrono::milliseconds MinimumHealthInterval{1000};
	std::chrono::milliseconds UptimeTickInterval{1000};
	uint32_t LogTailLines = 300;

	/// Run the health and uptime timers. Tests drive health checks by hand.
	bool EnableTimers = true;
	/// Never open a browser or launch desktop apps.
	bool SuppressSideEffects = false;

	/// @brief Defaults for a user home, with settings.json loaded from the state dir.
	static LauncherOptions ForStateDir(const std::filesystem::path& home,
									   const StatePaths& paths)
	{
		LauncherOptions options;
		options.Paths = paths;
		options.EngineSearch = DockerPaths::MakeDefault(home, paths.Root);
		options.Settings = LauncherSettings::Load(paths.SettingsFile());
		return options;
	}
};

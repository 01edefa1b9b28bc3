#include "LauncherSettings.hpp"

#include <array>
#include <fstream>

#include "Debug/Log.hpp"
#include "Global/pch.hpp"

namespace
{
constexpr std::array kMemoryLimits = {"1g", "2g", "4g", "8g"};
constexpr std::array kCpuLimits = {"1.0", "2.0", "4.0", "0"};

Log& Logger()
{
	static Log logger("Settings");
	return logger;
}
}  // namespace

bool LauncherSettings::IsValidMemoryLimit(const std::string& value)
{
	return std::find(kMemoryLimits.begin(), kMemoryLimits.end(), value) != kMemoryLimits.end();
}

bool LauncherSettings::IsValidCpuLimit(const std::string& value)
{
	return std::find(kCpuLimits.begin(), kCpuLimits.end(), value) != kCpuLimits.end();
}

LauncherSettings LauncherSettings::Load(const std::filesystem::path& file)
{
	LauncherSettings settings;
	std::ifstream in(file);
	if (!in.is_open())
		return settings;

	const Json json = Json::parse(in, nullptr, false);
	if (json.is_discarded() || !json.is_object())
	{
		Logger().WarningFormatted("Ignoring unreadable settings file {}", file.string());
		return settings;
	}

	auto IsEntryValid = [&json](const char* key) { return json.contains(key) && !json[key].is_null(); };

	if (IsEntryValid("healthCheckInterval") && json["healthCheckInterval"].is_number() &&
		json["healthCheckInterval"].get<double>() > 0)
		settings.healthCheckInterval = json["healthCheckInterval"].get<double>();
	if (IsEntryValid("openBrowserOnStart") && json["openBrowserOnStart"].is_boolean())
		settings.openBrowserOnStart = json["openBrowserOnStart"].get<bool>();
	if (IsEntryValid("dockerImage") && json["dockerImage"].is_string() &&
		!json["dockerImage"].get<std::string>().empty())
		settings.dockerImage = json["dockerImage"].get<std::string>();
	if (IsEntryValid("memoryLimit") && json["memoryLimit"].is_string() &&
		IsValidMemoryLimit(json["memoryLimit"].get<std::string>()))
		settings.memoryLimit = json["memoryLimit"].get<std::string>();
	if (IsEntryValid("cpuLimit"))
	{
		// Accept both "2.0" and 2.0.
		std::string cpu;
		if (json["cpuLimit"].is_string())
			cpu = json["cpuLimit"].get<std::string>();
		else if (json["cpuLimit"].is_number())
			cpu = std::format("{:.1f}", json["cpuLimit"].get<double>());
		if (cpu == "0.0")
			cpu = "0";
		if (IsValidCpuLimit(cpu))
			settings.cpuLimit = cpu;
	}
	if (IsEntryValid("port") && json["port"].is_number_integer())
	{
		const int64_t port = json["port"].get<int64_t>();
		if (port > 0 && port <= 65535)
			settings.port = static_cast<uint16_t>(port);
	}
	if (IsEntryValid("randomizePort") && json["randomizePort"].is_boolean())
		settings.randomizePort = json["randomizePort"].get<bool>();
	if (IsEntryValid("debugMode") && json["debugMode"].is_boolean())
		settings.debugMode = json["debugMode"].get<bool>();
	return settings;
}

void LauncherSettings::Save(const std::filesystem::path& file) const
{
	// nlohmann::json keeps object keys sorted.
	Json json = {
		{"healthCheckInterval", healthCheckInterval},
		{"openBrowserOnStart", openBrowserOnStart},
		{"dockerImage", dockerImage},
		{"memoryLimit", memoryLimit},
		{"cpuLimit", cpuLimit},
		{"port", port},
		{"randomizePort", randomizePort},
		{"debugMode", debugMode},
	};
	std::filesystem::create_directories(file.parent_path());
	std::ofstream out(file);
	if (!out.is_open())
		throw std::runtime_error("Failed to open file: " + file.string());
	out << json.dump(2) << "\n";
}

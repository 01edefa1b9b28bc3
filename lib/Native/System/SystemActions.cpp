#include "SystemActions.hpp"

#include <filesystem>

bool DesktopSystemActions::OpenURL(const std::string& url)
{
#ifdef __APPLE__
	const CommandResult result = runner.Execute({"open", url});
#else
	// xdg-open may hand off to a browser that outlives it; detach it from our pipes.
	const CommandResult result =
		runner.Execute({"sh", "-c", "xdg-open \"$0\" >/dev/null 2>&1 &", url});
#endif
	if (!result.Succeeded())
	{
		logger.WarningFormatted("Could not open browser (exit {}): {}", result.exit_code,
								result.stderr_text);
		return false;
	}
	return true;
}

bool DesktopSystemActions::LaunchEngineApp(const std::string& appPath)
{
	CommandResult result;
#ifdef __APPLE__
	result = runner.Execute({"open", "-a", appPath});
#else
	// Docker Desktop for Linux runs as a user unit; other engines ship a plain binary.
	if (std::filesystem::path(appPath).filename() == "docker-desktop")
		result = runner.Execute({"systemctl", "--user", "start", "docker-desktop"});
	else
		result = runner.Execute({"sh", "-c", "\"$0\" >/dev/null 2>&1 &", appPath});
#endif
	if (!result.Succeeded())
	{
		logger.WarningFormatted("Failed to launch {} (exit {}): {}", appPath, result.exit_code,
								result.stderr_text);
		return false;
	}
	logger.DebugFormatted("Launched {}", appPath);
	return true;
}

#include <csignal>
#include <vector>

#include "Debug/Crash/CrashHandler.hpp"
#include "Launcher.hpp"

int main(int argc, char **argv)
{
	CrashHandler::Get().Init("OpenClawLauncher");
	std::signal(SIGINT, [](int) { Launcher::RequestShutdown(); });
	std::signal(SIGTERM, [](int) { Launcher::RequestShutdown(); });

	const std::vector<std::string> args(argv + 1, argv + argc);
	const auto cmd = Launcher::Parse(args);
	if (!cmd)
		return 2;

	Launcher launcher;
	return launcher.Run(*cmd);
}

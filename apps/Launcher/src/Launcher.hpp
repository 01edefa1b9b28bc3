#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Debug/Log.hpp"
#include "Launcher/LaunchOrchestrator.hpp"

/// @brief Console front end: parses the command line, wires the production
/// collaborators into a LaunchOrchestrator and renders its snapshots.
class Launcher
{
   public:
	struct CommandLine
	{
		std::optional<std::filesystem::path> StateDir;
		bool NoBrowser = false;
		bool Debug = false;
		std::string Command = "start";
	};

	/// @return std::nullopt and prints usage on a malformed command line.
	static std::optional<CommandLine> Parse(const std::vector<std::string>& args);
	static void PrintUsage();

	int Run(const CommandLine& cmd);

	/// @brief Request a graceful end of supervision. Async-signal-safe.
	static void RequestShutdown() { shutdownRequested.store(true); }

   private:
	Log logger = Log("OpenClawLauncher");
	static inline std::atomic_bool shutdownRequested = false;

	std::mutex changeMutex;
	std::condition_variable changeCv;
	uint64_t changeCount = 0;

	// Console rendering state, touched only from subscriber callbacks.
	std::optional<std::chrono::system_clock::time_point> lastStepAt;
	std::optional<std::string> lastStepMessage;
	std::optional<std::string> lastProgress;
	std::optional<bool> lastHealthy;

	void Render(const LauncherSnapshot& snap);
	/// @brief Wait for the next snapshot change or a short timeout.
	void WaitForChange(uint64_t& seen);

	int RunStatus(const LauncherOptions& options, ICommandRunner& runner);
	int Supervise(LaunchOrchestrator& orchestrator);
	bool PromptForAuth(LaunchOrchestrator& orchestrator, const LauncherSnapshot& snap);
	static void PrintError(const LauncherSnapshot& snap);
};

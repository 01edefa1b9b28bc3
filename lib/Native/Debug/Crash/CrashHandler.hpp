#pragma once
#include <csignal>
#include <filesystem>
#include <string>

/// @brief Prints a stack trace to stderr on fatal signals, then exits.
class CrashHandler
{
	std::filesystem::path programPath;
	std::string programName;

	CrashHandler() = default;

   public:
	static CrashHandler& Get()
	{
		static CrashHandler instance;
		return instance;
	}

	void Init(const std::string& name);

	const std::filesystem::path& ProgramPath() const { return programPath; }

   private:
	static std::filesystem::path GetExecutablePath();
	static void OnSignal(int sig);
	void HandleSignal(int sig);
};

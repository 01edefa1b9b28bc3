#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

struct CommandResult
{
	int exit_code = -1;
	std::string stdout_text;
	std::string stderr_text;

	[[nodiscard]] bool Succeeded() const { return exit_code == 0; }
};

/// @brief Environment handed to every child process. Computed once as data,
/// never written back into the launcher's own environment.
struct CommandEnvironment
{
	/// Directories searched (in order) before the inherited PATH.
	std::vector<std::string> ExtraSearchDirs;
	/// Variables set or replaced in the child (e.g. DOCKER_CONFIG).
	std::map<std::string, std::string> Overrides;

	/// @brief ExtraSearchDirs followed by the given PATH value, ':' separated.
	[[nodiscard]] std::string BuildSearchPath(std::string_view currentPath) const;
};

class ICommandRunner
{
   public:
	using LineCallback = std::function<void(std::string_view)>;

	virtual ~ICommandRunner() = default;

	/// @brief Run argv[0] with the remaining arguments. Never throws on a
	/// non-zero exit; callers interpret exit_code.
	virtual CommandResult Execute(const std::vector<std::string>& argv) = 0;

	/// @brief Like Execute, and also reports every output line (stdout and
	/// stderr interleaved) as it arrives.
	virtual CommandResult ExecuteStreaming(const std::vector<std::string>& argv,
										   const LineCallback& onLine);
};

class ProcessCommandRunner : public ICommandRunner
{
	CommandEnvironment environment;

   public:
	explicit ProcessCommandRunner(CommandEnvironment env = {}) : environment(std::move(env)) {}

	CommandResult Execute(const std::vector<std::string>& argv) override;
	CommandResult ExecuteStreaming(const std::vector<std::string>& argv,
								   const LineCallback& onLine) override;

	[[nodiscard]] const CommandEnvironment& GetEnvironment() const { return environment; }

   private:
	CommandResult RunCapture(const std::vector<std::string>& argv, const LineCallback* onLine);
	/// @brief Resolve a bare program name against the augmented search path.
	std::string ResolveExecutable(const std::string& program, const std::string& searchPath) const;
	std::vector<std::string> BuildChildEnvironment(std::string& outSearchPath) const;
};

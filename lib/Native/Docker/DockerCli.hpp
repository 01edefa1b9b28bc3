#pragma once

#include <string>

#include "Command/CommandRunner.hpp"
#include "Docker/ContainerSpec.hpp"

/// @brief The container engine CLI surface the launcher consumes. Every call is
/// a subprocess through the injected runner; nothing is cached, so callers
/// always see the engine's current ground truth.
class DockerCli
{
	ICommandRunner& runner;
	std::string binary;

   public:
	explicit DockerCli(ICommandRunner& _runner, std::string _binary = "docker")
		: runner(_runner), binary(std::move(_binary))
	{
	}

	bool IsDaemonResponding();
	bool IsContainerRunning(const std::string& name);
	CommandResult PullImage(const std::string& image, const ICommandRunner::LineCallback& onLine);
	bool ImageExists(const std::string& image);
	CommandResult RunContainer(const ContainerRunSpec& run);
	CommandResult StopContainer(const std::string& name);
	CommandResult RestartContainer(const std::string& name);
	CommandResult RemoveContainer(const std::string& name);
	CommandResult Logs(const std::string& name, uint32_t tail);

   private:
	CommandResult Run(std::vector<std::string> args);
};

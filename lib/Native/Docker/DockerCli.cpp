#include "DockerCli.hpp"

#include "Global/Misc/String_utils.hpp"

CommandResult DockerCli::Run(std::vector<std::string> args)
{
	args.insert(args.begin(), binary);
	return runner.Execute(args);
}

bool DockerCli::IsDaemonResponding()
{
	return Run({"info"}).Succeeded();
}

bool DockerCli::IsContainerRunning(const std::string& name)
{
	const CommandResult ps =
		Run({"ps", "--filter", "name=^" + name + "$", "--format", "{{.Names}}"});
	if (!ps.Succeeded())
		return false;
	for (const auto& line : SplitLines(ps.stdout_text))
	{
		if (Trim(line) == name)
			return true;
	}
	return false;
}

CommandResult DockerCli::PullImage(const std::string& image,
								   const ICommandRunner::LineCallback& onLine)
{
	return runner.ExecuteStreaming({binary, "pull", image}, onLine);
}

bool DockerCli::ImageExists(const std::string& image)
{
	return Run({"image", "inspect", image}).Succeeded();
}

CommandResult DockerCli::RunContainer(const ContainerRunSpec& run)
{
	return Run(BuildRunArguments(run));
}

CommandResult DockerCli::StopContainer(const std::string& name)
{
	return Run({"stop", name});
}

CommandResult DockerCli::RestartContainer(const std::string& name)
{
	return Run({"restart", name});
}

CommandResult DockerCli::RemoveContainer(const std::string& name)
{
	return Run({"rm", "-f", name});
}

CommandResult DockerCli::Logs(const std::string& name, uint32_t tail)
{
	return Run({"logs", "--tail", std::to_string(tail), name});
}

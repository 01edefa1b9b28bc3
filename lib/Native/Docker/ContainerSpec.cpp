#include "ContainerSpec.hpp"

#include <format>

std::vector<std::string> BuildRunArguments(const ContainerRunSpec& run)
{
	using P = ContainerSecurityProfile;
	const std::string port = std::to_string(run.ContainerPort);

	std::vector<std::string> args = {
		"run", "-d", "--name", run.Name,

		// --- Isolation ---
		"--init",
		"--read-only",
		"--tmpfs", P::TmpMount,
		"--tmpfs", P::NpmCacheMount,

		// --- Resource limits (swap == memory, i.e. no swap) ---
		"--memory", run.Limits.Memory,
		"--memory-swap", run.Limits.Memory,
	};
	if (!run.Limits.Cpus.empty() && run.Limits.Cpus != "0")
	{
		args.insert(args.end(), {"--cpus", run.Limits.Cpus});
	}
	args.insert(args.end(), {
		"--pids-limit", std::to_string(run.Limits.PidsLimit),

		// --- Security ---
		"--cap-drop", P::DropCapabilities,
		"--cap-add", P::AddCapability,
		"--security-opt", P::SecurityOpt,

		// --- Network: loopback only ---
		"-p", std::format("{}:{}:{}", P::LoopbackAddress, run.HostPort, run.ContainerPort),

		// --- Persistent state ---
		"-v", run.ConfigDir.string() + ":/home/node/.openclaw",
		"-v", run.WorkspaceDir.string() + ":/home/node/.openclaw/workspace",

		// --- Environment ---
		"-e", "HOME=/home/node",
		"-e", "TERM=xterm-256color",
		"--env-file", run.EnvFile.string(),
		"-e", "NODE_ENV=production",

		"--restart", P::RestartPolicy,

		run.Image,

		// Upstream default CMD does not start the gateway.
		"node", "dist/index.js", "gateway", "--bind", "lan", "--port", port,
	});
	return args;
}

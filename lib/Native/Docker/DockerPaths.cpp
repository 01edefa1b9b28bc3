#include "DockerPaths.hpp"

#include <unistd.h>

namespace DockerPaths
{
SearchConfig MakeDefault(const std::filesystem::path& home, const std::filesystem::path& stateDir)
{
	const std::string h = home.string();
	SearchConfig config;
	config.BinaryPaths = {
		// --- Docker Desktop ---
		{"Docker Desktop", "/usr/local/bin/docker"},
		{"Docker Desktop", "/Applications/Docker.app/Contents/Resources/bin/docker"},
		{"Docker Desktop", h + "/.docker/bin/docker"},
		// --- Linux packages ---
		{"Docker Engine", "/usr/bin/docker"},
		{"Docker Engine", "/snap/bin/docker"},
		// --- OrbStack ---
		{"OrbStack", h + "/.orbstack/bin/docker"},
		{"OrbStack", "/Applications/OrbStack.app/Contents/Resources/bin/docker"},
		// --- Homebrew ---
		{"Homebrew", "/opt/homebrew/bin/docker"},
		{"Homebrew", "/home/linuxbrew/.linuxbrew/bin/docker"},
		// --- Colima (uses the Homebrew docker CLI) ---
		{"Colima", "/opt/homebrew/bin/colima"},
		{"Colima", "/usr/local/bin/colima"},
		// --- Rancher Desktop ---
		{"Rancher Desktop", h + "/.rd/bin/docker"},
		{"Rancher Desktop",
		 "/Applications/Rancher Desktop.app/Contents/Resources/resources/darwin/bin/docker"},
		// --- Podman (docker-compatible mode) ---
		{"Podman", "/opt/homebrew/bin/podman"},
		{"Podman", "/usr/local/bin/podman"},
		{"Podman", "/usr/bin/podman"},
		{"Podman", h + "/.local/bin/podman"},
		// --- Lima ---
		{"Lima", "/opt/homebrew/bin/limactl"},
		{"Lima", "/usr/local/bin/limactl"},
		// --- Nix ---
		{"Nix", h + "/.nix-profile/bin/docker"},
		{"Nix", "/run/current-system/sw/bin/docker"},
		// --- MacPorts ---
		{"MacPorts", "/opt/local/bin/docker"},
	};
	config.AppPaths = {
		{"Docker Desktop", "/Applications/Docker.app"},
		{"OrbStack", "/Applications/OrbStack.app"},
		{"Rancher Desktop", "/Applications/Rancher Desktop.app"},
		{"Podman Desktop", "/Applications/Podman Desktop.app"},
		{"Docker Desktop", "/opt/docker-desktop"},
	};
	config.ExtraPathDirs = {
		"/usr/local/bin",
		"/opt/homebrew/bin",
		"/opt/homebrew/sbin",
		"/Applications/Docker.app/Contents/Resources/bin",
		h + "/.docker/bin",
		h + "/.orbstack/bin",
		h + "/.rd/bin",
		h + "/.local/bin",
		h + "/.nix-profile/bin",
		"/run/current-system/sw/bin",
		"/opt/local/bin",
		"/snap/bin",
	};
	config.DockerConfigDir = stateDir / ".docker";
	return config;
}

std::optional<Location> FindEngineBinary(const SearchConfig& config)
{
	for (const auto& entry : config.BinaryPaths)
	{
		std::error_code ec;
		if (std::filesystem::is_regular_file(entry.Path, ec) &&
			::access(entry.Path.c_str(), X_OK) == 0)
			return entry;
	}
	return std::nullopt;
}

std::optional<Location> FindInstalledApp(const SearchConfig& config)
{
	for (const auto& entry : config.AppPaths)
	{
		std::error_code ec;
		if (std::filesystem::exists(entry.Path, ec))
			return entry;
	}
	return std::nullopt;
}

CommandEnvironment MakeCommandEnvironment(const SearchConfig& config)
{
	CommandEnvironment env;
	env.ExtraSearchDirs = config.ExtraPathDirs;
	if (!config.DockerConfigDir.empty())
		env.Overrides["DOCKER_CONFIG"] = config.DockerConfigDir.string();
	return env;
}
}  // namespace DockerPaths

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "Command/CommandRunner.hpp"

/// @brief Container engine discovery by direct filesystem probing.
///
/// A launcher started from a desktop session often inherits a minimal PATH
/// (/usr/bin:/bin:/usr/sbin:/sbin) that misses the engine CLI, so nothing here
/// depends on PATH lookup.
namespace DockerPaths
{
struct Location
{
	std::string Backend;
	std::string Path;
};

struct SearchConfig
{
	/// Engine CLI candidates, most likely first.
	std::vector<Location> BinaryPaths;
	/// Desktop application bundles / installs that provide the daemon.
	std::vector<Location> AppPaths;
	/// Directories prepended to PATH for every child process.
	std::vector<std::string> ExtraPathDirs;
	/// Isolated config dir for the engine's credential helper.
	std::filesystem::path DockerConfigDir;
};

/// @brief Default search lists with $HOME expanded once.
SearchConfig MakeDefault(const std::filesystem::path& home,
						 const std::filesystem::path& stateDir);

std::optional<Location> FindEngineBinary(const SearchConfig& config);
std::optional<Location> FindInstalledApp(const SearchConfig& config);

/// @brief Environment for ProcessCommandRunner: augmented PATH and DOCKER_CONFIG.
CommandEnvironment MakeCommandEnvironment(const SearchConfig& config);
}  // namespace DockerPaths

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/// @brief Fixed lockdown flags asserted on every container this launcher creates.
/// Only the resource ceilings in ContainerResourceLimits are configurable.
struct ContainerSecurityProfile
{
	static constexpr const char* LoopbackAddress = "127.0.0.1";
	static constexpr const char* DropCapabilities = "ALL";
	// Only capability kept: binding a port in the privileged range.
	static constexpr const char* AddCapability = "NET_BIND_SERVICE";
	static constexpr const char* SecurityOpt = "no-new-privileges:true";
	static constexpr const char* TmpMount = "/tmp:rw,noexec,nosuid,size=256m";
	static constexpr const char* NpmCacheMount = "/home/node/.npm:rw,size=64m";
	static constexpr const char* RestartPolicy = "unless-stopped";
};

struct ContainerResourceLimits
{
	std::string Memory = "2g";
	/// "0" means no CPU ceiling; the flag is omitted.
	std::string Cpus = "2.0";
	uint32_t PidsLimit = 256;
};

struct ContainerRunSpec
{
	std::string Name;
	std::string Image;
	uint16_t HostPort = 0;
	uint16_t ContainerPort = 18789;
	std::filesystem::path ConfigDir;
	std::filesystem::path WorkspaceDir;
	std::filesystem::path EnvFile;
	ContainerResourceLimits Limits;
};

/// @brief Full `docker run` argument list (without the engine binary itself)
/// for a locked-down gateway container.
std::vector<std::string> BuildRunArguments(const ContainerRunSpec& run);

#pragma once
#include <filesystem>

/// @brief On-disk layout of the launcher state directory.
struct StatePaths
{
	std::filesystem::path Root;
	/// Pre-rename location, moved to Root once if Root does not exist yet.
	std::filesystem::path LegacyRoot;

	static StatePaths ForHome(const std::filesystem::path& home)
	{
		return StatePaths{home / ".openclaw-launcher", home / ".openclaw-docker"};
	}

	std::filesystem::path EnvFile() const { return Root / ".env"; }
	std::filesystem::path SettingsFile() const { return Root / "settings.json"; }
	std::filesystem::path LogFile() const { return Root / "launcher.log"; }
	std::filesystem::path DockerConfigDir() const { return Root / ".docker"; }
	std::filesystem::path WorkspaceDir() const { return Root / "workspace"; }
	std::filesystem::path ConfigDir() const { return Root / "config"; }
	std::filesystem::path ConfigFile() const { return ConfigDir() / "openclaw.json"; }
	std::filesystem::path AgentDir() const { return ConfigDir() / "agents/default/agent"; }
	std::filesystem::path SessionsDir() const { return ConfigDir() / "agents/default/sessions"; }
	std::filesystem::path AuthProfileFile() const { return AgentDir() / "auth-profiles.json"; }
	std::filesystem::path CredentialsDir() const { return ConfigDir() / "credentials"; }
	std::filesystem::path OAuthFile() const { return CredentialsDir() / "oauth.json"; }
};

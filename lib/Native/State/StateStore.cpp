#include "StateStore.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "Global/Misc/String_utils.hpp"
#include "Global/pch.hpp"
#include "Security/SecretGenerator.hpp"

namespace fs = std::filesystem;

namespace
{
constexpr fs::perms kOwnerFile = fs::perms::owner_read | fs::perms::owner_write;
constexpr fs::perms kOwnerDir = fs::perms::owner_all;

std::optional<std::string> ReadFile(const fs::path& file_path)
{
	std::ifstream input(file_path);
	if (!input.is_open())
		return std::nullopt;

	std::stringstream buffer;
	buffer << input.rdbuf();
	return buffer.str();
}

std::optional<Json> ReadJsonFile(const fs::path& file_path)
{
	auto content = ReadFile(file_path);
	if (!content)
		return std::nullopt;
	Json parsed = Json::parse(*content, nullptr, false);
	if (parsed.is_discarded())
		return std::nullopt;
	return parsed;
}
}  // namespace

void StateStore::WriteSecretFile(const fs::path& path, const std::string& content)
{
	fs::create_directories(path.parent_path());

	// Created 0600 up front so the secret is never readable by others, even briefly.
	const fs::path tmp = path.string() + ".tmp";
	int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
	if (fd < 0)
	{
		throw std::runtime_error(
			std::format("Failed to open {}: {}", tmp.string(), std::strerror(errno)));
	}

	auto fail = [&](std::string_view step)
	{
		const std::string reason = std::strerror(errno);
		if (fd >= 0)
			::close(fd);
		::unlink(tmp.c_str());
		throw std::runtime_error(std::format("Failed to {} {}: {}", step, tmp.string(), reason));
	};

	// A stale temp file keeps its old mode through O_CREAT.
	if (::fchmod(fd, 0600) != 0)
		fail("chmod");

	const char* data = content.data();
	size_t left = content.size();
	while (left > 0)
	{
		const ssize_t n = ::write(fd, data, left);
		if (n < 0 && errno == EINTR)
			continue;
		if (n <= 0)
			fail("write");
		data += n;
		left -= static_cast<size_t>(n);
	}

	const int closed = ::close(fd);
	fd = -1;
	if (closed != 0)
		fail("close");

	fs::rename(tmp, path);
	fs::permissions(path, kOwnerFile, fs::perm_options::replace);
}

bool StateStore::MigrateLegacyDirectoryIfPresent()
{
	std::error_code ec;
	if (paths.LegacyRoot.empty() || !fs::exists(paths.LegacyRoot, ec) || fs::exists(paths.Root, ec))
		return false;

	fs::rename(paths.LegacyRoot, paths.Root, ec);
	if (ec)
	{
		logger.WarningFormatted("Could not migrate {} to {}: {}", paths.LegacyRoot.string(),
								paths.Root.string(), ec.message());
		return false;
	}
	logger.DebugFormatted("Migrated {} -> {}", paths.LegacyRoot.string(), paths.Root.string());
	return true;
}

bool StateStore::EnvFileExists() const
{
	std::error_code ec;
	return fs::exists(paths.EnvFile(), ec);
}

std::optional<GatewayEnvironment> StateStore::ReadEnvironment() const
{
	const auto content = ReadFile(paths.EnvFile());
	if (!content)
		return std::nullopt;

	GatewayEnvironment env;
	const std::string tokenPrefix = std::string(TokenKey) + "=";
	const std::string portPrefix = std::string(PortKey) + "=";
	for (const auto& raw : SplitLines(*content))
	{
		const std::string line = Trim(raw);
		if (StartsWith(line, tokenPrefix))
		{
			env.Token = line.substr(tokenPrefix.size());
		}
		else if (StartsWith(line, portPrefix))
		{
			try
			{
				const int port = std::stoi(line.substr(portPrefix.size()));
				if (port > 0 && port <= 65535)
					env.Port = static_cast<uint16_t>(port);
			}
			catch (const std::exception&)
			{
				logger.WarningFormatted("Ignoring malformed {} in {}", PortKey,
										paths.EnvFile().string());
			}
		}
	}
	return env;
}

std::optional<std::string> StateStore::ReadConfigToken() const
{
	const auto config = ReadJsonFile(paths.ConfigFile());
	if (!config)
		return std::nullopt;
	const Json::json_pointer tokenPtr("/gateway/auth/token");
	if (!config->contains(tokenPtr) || !config->at(tokenPtr).is_string())
		return std::nullopt;
	return config->at(tokenPtr).get<std::string>();
}

void StateStore::WriteEnvironment(const GatewayEnvironment& env)
{
	WriteSecretFile(paths.EnvFile(),
					std::format("{}={}\n{}={}\n", TokenKey, env.Token, PortKey, env.Port));
}

void StateStore::WriteGatewayConfig(const std::string& token)
{
	Ordered_Json config;
	config["gateway"]["mode"] = "local";
	config["gateway"]["bind"] = "lan";
	config["gateway"]["auth"] = {{"mode", "token"}, {"token", token}};
	config["gateway"]["controlUi"] = {
		{"enabled", true},
		{"basePath", "/openclaw"},
		{"dangerouslyDisableDeviceAuth", true},
	};
	config["agents"]["defaults"]["workspace"] = "/home/node/.openclaw/workspace";
	config["agents"]["defaults"]["model"]["primary"] = "anthropic/claude-opus-4-5";

	WriteSecretFile(paths.ConfigFile(), config.dump(2) + "\n");
}

StateStore::InitResult StateStore::LoadOrInitialize(const std::function<uint16_t()>& choosePort)
{
	MigrateLegacyDirectoryIfPresent();

	InitResult result;
	if (EnvFileExists())
	{
		// Never regenerated once written; a missing token is reported by the caller.
		result.Env = ReadEnvironment().value_or(GatewayEnvironment{});
		return result;
	}

	result.FirstRun = true;
	fs::create_directories(paths.ConfigDir());
	fs::create_directories(paths.WorkspaceDir());
	fs::create_directories(paths.AgentDir());
	fs::create_directories(paths.SessionsDir());

	result.Env.Token = SecretGenerator::GenerateGatewaySecret();
	result.Env.Port = choosePort();

	WriteGatewayConfig(result.Env.Token);
	// .env last: its presence marks setup as complete.
	WriteEnvironment(result.Env);
	logger.Debug("First-run configuration written");
	return result;
}

void StateStore::WriteOAuthCredentials(const OAuthCredentials& creds)
{
	fs::create_directories(paths.CredentialsDir());
	fs::permissions(paths.CredentialsDir(), kOwnerDir, fs::perm_options::replace);

	Json json;
	json[ProviderKey] = {
		{"type", creds.Type},
		{"refresh", creds.Refresh},
		{"access", creds.Access},
		{"expires", creds.ExpiresAtEpochMs},
	};
	WriteSecretFile(paths.OAuthFile(), json.dump(2) + "\n");
}

std::optional<OAuthCredentials> StateStore::ReadOAuthCredentials() const
{
	const auto json = ReadJsonFile(paths.OAuthFile());
	if (!json || !json->contains(ProviderKey))
		return std::nullopt;

	const Json& entry = (*json)[ProviderKey];
	if (!entry.is_object() || !entry.contains("refresh") || !entry["refresh"].is_string() ||
		!entry.contains("expires") || !entry["expires"].is_number())
		return std::nullopt;

	OAuthCredentials creds;
	creds.Type = entry.value("type", std::string("oauth"));
	creds.Refresh = entry["refresh"].get<std::string>();
	creds.Access = entry.value("access", std::string());
	creds.ExpiresAtEpochMs = entry["expires"].get<int64_t>();
	return creds;
}

bool StateStore::HasOAuthCredentials() const
{
	std::error_code ec;
	return fs::exists(paths.OAuthFile(), ec);
}

void StateStore::WriteApiKeyProfile(const std::string& key)
{
	Json profile;
	profile["version"] = 1;
	profile["profiles"]["anthropic:default"] = {
		{"type", "api_key"},
		{"provider", ProviderKey},
		{"key", key},
	};
	WriteSecretFile(paths.AuthProfileFile(), profile.dump(2) + "\n");
}

bool StateStore::HasApiKeyProfile() const
{
	std::error_code ec;
	return fs::exists(paths.AuthProfileFile(), ec);
}

void StateStore::DeleteCredentials()
{
	std::error_code ec;
	fs::remove(paths.AuthProfileFile(), ec);
	if (ec)
		logger.WarningFormatted("Could not remove {}: {}", paths.AuthProfileFile().string(),
								ec.message());
	fs::remove(paths.OAuthFile(), ec);
	if (ec)
		logger.WarningFormatted("Could not remove {}: {}", paths.OAuthFile().string(), ec.message());
}

void StateStore::DeleteAll()
{
	std::error_code ec;
	fs::remove_all(paths.Root, ec);
	if (ec)
	{
		throw std::runtime_error(
			std::format("Failed to remove {}: {}", paths.Root.string(), ec.message()));
	}
}

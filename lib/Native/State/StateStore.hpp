#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "Debug/Log.hpp"
#include "OAuth/OAuthCredentials.hpp"
#include "State/StatePaths.hpp"

struct GatewayEnvironment
{
	std::string Token;
	uint16_t Port = 0;
};

/// @brief Sole owner of every file under the state directory. Files holding a
/// secret are always written mode 600, credential directories mode 700.
class StateStore
{
	StatePaths paths;
	Log logger = Log("StateStore");

   public:
	static constexpr const char* TokenKey = "OPENCLAW_GATEWAY_TOKEN";
	static constexpr const char* PortKey = "OPENCLAW_PORT";
	static constexpr const char* ProviderKey = "anthropic";

	explicit StateStore(StatePaths _paths) : paths(std::move(_paths)) {}

	const StatePaths& Paths() const { return paths; }

	struct InitResult
	{
		GatewayEnvironment Env;
		bool FirstRun = false;
	};
	/// @brief Load the persisted token/port, or on first run create the tree,
	/// generate the gateway secret and write .env and the gateway config.
	/// @param choosePort consulted only on first run.
	InitResult LoadOrInitialize(const std::function<uint16_t()>& choosePort);

	/// @return true if a legacy directory was moved into place.
	bool MigrateLegacyDirectoryIfPresent();

	bool EnvFileExists() const;
	std::optional<GatewayEnvironment> ReadEnvironment() const;
	/// @brief Token embedded in the gateway config, if the config is readable.
	std::optional<std::string> ReadConfigToken() const;

	void WriteOAuthCredentials(const OAuthCredentials& creds);
	std::optional<OAuthCredentials> ReadOAuthCredentials() const;
	bool HasOAuthCredentials() const;

	void WriteApiKeyProfile(const std::string& key);
	bool HasApiKeyProfile() const;

	/// @brief Remove the API key profile and OAuth credentials only.
	void DeleteCredentials();
	/// @brief Remove the entire state directory.
	void DeleteAll();

	static void WriteSecretFile(const std::filesystem::path& path, const std::string& content);

   private:
	void WriteEnvironment(const GatewayEnvironment& env);
	void WriteGatewayConfig(const std::string& token);
};

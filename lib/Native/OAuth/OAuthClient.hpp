#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

#include "Http/HttpClient.hpp"
#include "OAuth/OAuthCredentials.hpp"

class OAuthError : public std::runtime_error
{
   public:
	OAuthError(const std::string& message, long httpStatus = 0)
		: std::runtime_error(message), HttpStatus(httpStatus)
	{
	}
	long HttpStatus;
};

struct PKCE
{
	std::string verifier;
	std::string challenge;
};

/// @brief Authorization-code + PKCE client for the fixed Anthropic provider.
class OAuthClient
{
	IHttpClient& http;

   public:
	static constexpr const char* ClientId = "9d1c250a-e61b-44d9-88ed-5944d1962f5e";
	static constexpr const char* AuthorizeEndpoint = "https://claude.ai/oauth/authorize";
	static constexpr const char* TokenEndpoint = "https://console.anthropic.com/v1/oauth/token";
	// Web redirect; the user copies the code back by hand.
	static constexpr const char* RedirectURI = "https://console.anthropic.com/oauth/code/callback";
	static constexpr const char* Scopes = "org:create_api_key user:profile user:inference";
	static constexpr std::chrono::minutes ExpirySafetyMargin{5};
	static constexpr std::chrono::seconds RequestTimeout{30};

	explicit OAuthClient(IHttpClient& _http) : http(_http) {}

	/// @brief 32 random bytes as base64url verifier; challenge = base64url(sha256(verifier)).
	static PKCE GeneratePKCE();
	static std::string ChallengeFor(std::string_view verifier);

	/// @brief Deterministic authorize URL. The verifier doubles as `state` so the
	/// exchange needs no extra round trip.
	static std::string BuildAuthorizeURL(const PKCE& pkce);

	/// @throws OAuthError on non-2xx or a response missing any token field.
	OAuthCredentials ExchangeCode(const std::string& code, const std::string& verifier);
	/// @throws OAuthError on non-2xx or a response missing access_token/expires_in.
	/// Keeps the old refresh token when the provider does not rotate it.
	OAuthCredentials RefreshAccessToken(const std::string& refreshToken);

   private:
	Json PostToken(const Json& payload, std::string_view failurePrefix);
};

/// @brief Accepts a bare code, a full callback URL, or "code#state" and returns the code.
std::string NormalizeAuthorizationCode(std::string_view input);

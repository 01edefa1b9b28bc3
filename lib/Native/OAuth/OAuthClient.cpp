#include "OAuthClient.hpp"

#include <format>

#include "Global/Misc/String_utils.hpp"
#include "Security/SecretGenerator.hpp"

namespace
{
constexpr size_t kVerifierBytes = 32;

int64_t ComputeExpiry(const Json& expiresIn)
{
	using namespace std::chrono;
	const auto lifetime = duration_cast<milliseconds>(duration<double>(expiresIn.get<double>()));
	const auto margin = duration_cast<milliseconds>(OAuthClient::ExpirySafetyMargin);
	return NowEpochMs() + lifetime.count() - margin.count();
}

bool HasString(const Json& json, const char* key)
{
	return json.contains(key) && json[key].is_string();
}
}  // namespace

PKCE OAuthClient::GeneratePKCE()
{
	const auto bytes = SecretGenerator::RandomBytes(kVerifierBytes);
	PKCE pkce;
	pkce.verifier = SecretGenerator::Base64UrlEncode(bytes.data(), bytes.size());
	pkce.challenge = ChallengeFor(pkce.verifier);
	return pkce;
}

std::string OAuthClient::ChallengeFor(std::string_view verifier)
{
	const auto digest = SecretGenerator::Sha256(verifier);
	return SecretGenerator::Base64UrlEncode(digest.data(), digest.size());
}

std::string OAuthClient::BuildAuthorizeURL(const PKCE& pkce)
{
	const std::pair<const char*, std::string> params[] = {
		{"code", "true"},
		{"client_id", ClientId},
		{"response_type", "code"},
		{"redirect_uri", RedirectURI},
		{"scope", Scopes},
		{"code_challenge", pkce.challenge},
		{"code_challenge_method", "S256"},
		{"state", pkce.verifier},
	};
	std::string url = AuthorizeEndpoint;
	char sep = '?';
	for (const auto& [key, value] : params)
	{
		url += sep;
		url += key;
		url += '=';
		url += Url::Encode(value);
		sep = '&';
	}
	return url;
}

Json OAuthClient::PostToken(const Json& payload, std::string_view failurePrefix)
{
	HttpResponse response;
	try
	{
		response = http.PostJson(TokenEndpoint, payload, RequestTimeout);
	}
	catch (const std::exception& e)
	{
		throw OAuthError(std::format("{}: {}", failurePrefix, e.what()));
	}
	if (!response.Ok())
	{
		throw OAuthError(std::format("{}: {}", failurePrefix, response.body), response.status);
	}

	Json decoded = Json::parse(response.body, nullptr, false);
	if (decoded.is_discarded() || !decoded.is_object())
	{
		throw OAuthError("Unexpected token response", response.status);
	}
	return decoded;
}

OAuthCredentials OAuthClient::ExchangeCode(const std::string& code, const std::string& verifier)
{
	const Json payload = {
		{"grant_type", "authorization_code"},
		{"client_id", ClientId},
		{"code", code},
		{"state", verifier},
		{"redirect_uri", RedirectURI},
		{"code_verifier", verifier},
	};
	const Json decoded = PostToken(payload, "Token exchange failed");

	if (!HasString(decoded, "access_token") || !HasString(decoded, "refresh_token") ||
		!decoded.contains("expires_in") || !decoded["expires_in"].is_number())
	{
		throw OAuthError("Unexpected token response");
	}

	OAuthCredentials creds;
	creds.Access = decoded["access_token"].get<std::string>();
	creds.Refresh = decoded["refresh_token"].get<std::string>();
	creds.ExpiresAtEpochMs = ComputeExpiry(decoded["expires_in"]);
	return creds;
}

OAuthCredentials OAuthClient::RefreshAccessToken(const std::string& refreshToken)
{
	const Json payload = {
		{"grant_type", "refresh_token"},
		{"client_id", ClientId},
		{"refresh_token", refreshToken},
	};
	const Json decoded = PostToken(payload, "Token refresh failed");

	if (!HasString(decoded, "access_token") || !decoded.contains("expires_in") ||
		!decoded["expires_in"].is_number())
	{
		throw OAuthError("Unexpected refresh response");
	}

	OAuthCredentials creds;
	creds.Access = decoded["access_token"].get<std::string>();
	creds.Refresh =
		HasString(decoded, "refresh_token") ? decoded["refresh_token"].get<std::string>() : refreshToken;
	creds.ExpiresAtEpochMs = ComputeExpiry(decoded["expires_in"]);
	return creds;
}

std::string NormalizeAuthorizationCode(std::string_view input)
{
	std::string code = Trim(input);

	if (code.find("://") != std::string::npos || code.find('?') != std::string::npos)
	{
		if (auto param = Url::QueryParameter(code, "code"); param && !param->empty())
			code = *param;
	}

	// The provider hands out "code#state"; only the code part is exchanged.
	if (const size_t hash = code.find('#'); hash != std::string::npos)
		code.erase(hash);

	return code;
}

#include <gtest/gtest.h>

#include "Global/Misc/String_utils.hpp"
#include "OAuth/OAuthClient.hpp"
#include "TestDoubles.hpp"

TEST(OAuthClient, ChallengeMatchesRfc7636Vector)
{
	EXPECT_EQ(OAuthClient::ChallengeFor("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk"),
			  "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST(OAuthClient, GeneratedPairIsConsistent)
{
	const PKCE a = OAuthClient::GeneratePKCE();
	const PKCE b = OAuthClient::GeneratePKCE();
	EXPECT_EQ(a.challenge, OAuthClient::ChallengeFor(a.verifier));
	EXPECT_NE(a.verifier, b.verifier);
	// 32 bytes -> 43 unpadded base64url characters.
	EXPECT_EQ(a.verifier.size(), 43u);
	EXPECT_EQ(a.verifier.find_first_of("+/="), std::string::npos);
}

TEST(OAuthClient, AuthorizeURLCarriesEveryParameter)
{
	const PKCE pkce{"verifier-abc", "challenge-xyz"};
	const std::string url = OAuthClient::BuildAuthorizeURL(pkce);

	EXPECT_TRUE(StartsWith(url, "https://claude.ai/oauth/authorize?code=true&"));
	EXPECT_EQ(Url::QueryParameter(url, "client_id"), OAuthClient::ClientId);
	EXPECT_EQ(Url::QueryParameter(url, "response_type"), "code");
	EXPECT_EQ(Url::QueryParameter(url, "redirect_uri"), OAuthClient::RedirectURI);
	EXPECT_EQ(Url::QueryParameter(url, "scope"), OAuthClient::Scopes);
	EXPECT_EQ(Url::QueryParameter(url, "code_challenge"), "challenge-xyz");
	EXPECT_EQ(Url::QueryParameter(url, "code_challenge_method"), "S256");
	EXPECT_EQ(Url::QueryParameter(url, "state"), "verifier-abc");
	EXPECT_EQ(url.find(' '), std::string::npos);
}

TEST(OAuthClient, NormalizesPastedCodes)
{
	EXPECT_EQ(NormalizeAuthorizationCode("abc123"), "abc123");
	EXPECT_EQ(NormalizeAuthorizationCode("  abc123 \n"), "abc123");
	EXPECT_EQ(NormalizeAuthorizationCode("abc123#state-value"), "abc123");
	EXPECT_EQ(NormalizeAuthorizationCode("https://x/callback?code=abc123&state=y"), "abc123");
	EXPECT_EQ(NormalizeAuthorizationCode("https://x/callback?state=y&code=abc123#frag"), "abc123");
	EXPECT_EQ(NormalizeAuthorizationCode(""), "");
}

TEST(OAuthClient, ExchangeCodeSendsPkceVerifier)
{
	FakeHttpClient http;
	http.OnPost({200, R"({"access_token":"acc","refresh_token":"ref","expires_in":3600})"});
	OAuthClient client(http);

	const int64_t before = NowEpochMs();
	const OAuthCredentials creds = client.ExchangeCode("the-code", "the-verifier");
	const int64_t after = NowEpochMs();

	EXPECT_EQ(creds.Type, "oauth");
	EXPECT_EQ(creds.Access, "acc");
	EXPECT_EQ(creds.Refresh, "ref");
	// One hour minus the five minute safety margin.
	EXPECT_GE(creds.ExpiresAtEpochMs, before + 3300000);
	EXPECT_LE(creds.ExpiresAtEpochMs, after + 3300000);
	EXPECT_FALSE(creds.IsExpired(after));

	const auto posts = http.Posts();
	ASSERT_EQ(posts.size(), 1u);
	EXPECT_EQ(posts[0].Url, OAuthClient::TokenEndpoint);
	EXPECT_EQ(posts[0].Body["grant_type"], "authorization_code");
	EXPECT_EQ(posts[0].Body["code"], "the-code");
	EXPECT_EQ(posts[0].Body["code_verifier"], "the-verifier");
	EXPECT_EQ(posts[0].Body["state"], "the-verifier");
	EXPECT_EQ(posts[0].Body["client_id"], OAuthClient::ClientId);
	EXPECT_EQ(posts[0].Body["redirect_uri"], OAuthClient::RedirectURI);
}

TEST(OAuthClient, ExchangeFailureCarriesProviderBody)
{
	FakeHttpClient http;
	http.OnPost({400, "invalid_grant"});
	OAuthClient client(http);

	try
	{
		client.ExchangeCode("bad", "v");
		FAIL() << "expected OAuthError";
	}
	catch (const OAuthError& e)
	{
		EXPECT_STREQ(e.what(), "Token exchange failed: invalid_grant");
		EXPECT_EQ(e.HttpStatus, 400);
	}
}

TEST(OAuthClient, ExchangeRejectsIncompleteResponse)
{
	FakeHttpClient http;
	http.OnPost({200, R"({"access_token":"acc","expires_in":3600})"});
	OAuthClient client(http);
	EXPECT_THROW(client.ExchangeCode("c", "v"), OAuthError);

	http.OnPost({200, "not json"});
	EXPECT_THROW(client.ExchangeCode("c", "v"), OAuthError);
}

TEST(OAuthClient, TransportFailureBecomesOAuthError)
{
	FakeHttpClient http;
	OAuthClient client(http);
	EXPECT_THROW(client.RefreshAccessToken("r"), OAuthError);
}

TEST(OAuthClient, RefreshKeepsOldRefreshTokenUnlessRotated)
{
	FakeHttpClient http;
	OAuthClient client(http);

	http.OnPost({200, R"({"access_token":"new-access","expires_in":600})"});
	OAuthCredentials kept = client.RefreshAccessToken("old-refresh");
	EXPECT_EQ(kept.Access, "new-access");
	EXPECT_EQ(kept.Refresh, "old-refresh");

	http.OnPost({200, R"({"access_token":"a2","refresh_token":"rotated","expires_in":600})"});
	OAuthCredentials rotated = client.RefreshAccessToken("old-refresh");
	EXPECT_EQ(rotated.Refresh, "rotated");

	const auto posts = http.Posts();
	ASSERT_EQ(posts.size(), 2u);
	EXPECT_EQ(posts[0].Body["grant_type"], "refresh_token");
	EXPECT_EQ(posts[0].Body["refresh_token"], "old-refresh");
}

TEST(OAuthClient, RefreshFailureMessage)
{
	FakeHttpClient http;
	http.OnPost({401, "expired"});
	OAuthClient client(http);
	try
	{
		client.RefreshAccessToken("r");
		FAIL() << "expected OAuthError";
	}
	catch (const OAuthError& e)
	{
		EXPECT_STREQ(e.what(), "Token refresh failed: expired");
	}
}

TEST(Url, QueryParameterDecodes)
{
	EXPECT_EQ(Url::QueryParameter("https://h/p?a=1&b=x%20y", "b"), "x y");
	EXPECT_EQ(Url::QueryParameter("https://h/p?a=1", "b"), std::nullopt);
	EXPECT_EQ(Url::QueryParameter("https://h/p", "a"), std::nullopt);
	EXPECT_EQ(Url::Decode(Url::Encode("org:create_api_key user:profile")),
			  "org:create_api_key user:profile");
}

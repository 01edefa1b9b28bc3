#pragma once
#include <chrono>
#include <cstdint>
#include <string>

struct OAuthCredentials
{
	std::string Type = "oauth";
	std::string Refresh;
	std::string Access;
	/// Provider expiry minus the refresh safety margin, epoch milliseconds.
	int64_t ExpiresAtEpochMs = 0;

	[[nodiscard]] bool IsExpired(int64_t nowEpochMs) const { return nowEpochMs >= ExpiresAtEpochMs; }
};

inline int64_t NowEpochMs()
{
	using namespace std::chrono;
	return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

class SecretGenerator
{
   public:
	static constexpr size_t GatewaySecretBytes = 32;

	/// @brief 64 lowercase hex characters from the OpenSSL CSPRNG.
	/// @throws std::runtime_error if the CSPRNG cannot be seeded.
	static std::string GenerateGatewaySecret();

	static std::vector<uint8_t> RandomBytes(size_t count);
	static std::string ToHex(const uint8_t* data, size_t len);
	/// @brief RFC 4648 base64url, no padding.
	static std::string Base64UrlEncode(const uint8_t* data, size_t len);
	static std::vector<uint8_t> Sha256(std::string_view input);
	static bool IsGatewaySecret(std::string_view candidate);
};

#include "SecretGenerator.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string SecretGenerator::ToHex(const uint8_t* data, size_t len)
{
	std::ostringstream oss;
	oss << std::hex << std::setfill('0');
	for (size_t i = 0; i < len; ++i) oss << std::setw(2) << (int)data[i];
	return oss.str();
}

std::vector<uint8_t> SecretGenerator::RandomBytes(size_t count)
{
	std::vector<uint8_t> bytes(count);
	if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1)
	{
		throw std::runtime_error("RAND_bytes failed: system random source unavailable");
	}
	return bytes;
}

std::string SecretGenerator::GenerateGatewaySecret()
{
	const auto bytes = RandomBytes(GatewaySecretBytes);
	return ToHex(bytes.data(), bytes.size());  // 64 hex chars
}

std::string SecretGenerator::Base64UrlEncode(const uint8_t* data, size_t len)
{
	std::string out(4 * ((len + 2) / 3), '\0');
	const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
										static_cast<int>(len));
	out.resize(written < 0 ? 0 : static_cast<size_t>(written));

	for (char& c : out)
	{
		if (c == '+')
			c = '-';
		else if (c == '/')
			c = '_';
	}
	while (!out.empty() && out.back() == '=') out.pop_back();
	return out;
}

std::vector<uint8_t> SecretGenerator::Sha256(std::string_view input)
{
	std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
	SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest.data());
	return digest;
}

bool SecretGenerator::IsGatewaySecret(std::string_view candidate)
{
	if (candidate.size() != GatewaySecretBytes * 2)
		return false;
	for (char c : candidate)
	{
		const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
		if (!hex)
			return false;
	}
	return true;
}

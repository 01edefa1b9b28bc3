#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "Global/pch.hpp"

struct HttpResponse
{
	long status = 0;
	std::string body;

	[[nodiscard]] bool Ok() const { return status >= 200 && status < 300; }
};

class IHttpClient
{
   public:
	virtual ~IHttpClient() = default;

	/// @throws std::runtime_error on transport failure (refused, timeout, DNS).
	/// An HTTP error status is not a transport failure.
	virtual HttpResponse Get(const std::string& url, std::chrono::milliseconds timeout) = 0;
	virtual HttpResponse PostJson(const std::string& url, const Json& body,
								  std::chrono::milliseconds timeout) = 0;
};

class CurlHttpClient : public IHttpClient
{
   public:
	CurlHttpClient();

	HttpResponse Get(const std::string& url, std::chrono::milliseconds timeout) override;
	HttpResponse PostJson(const std::string& url, const Json& body,
						  std::chrono::milliseconds timeout) override;

   private:
	HttpResponse request(const std::string& method, const std::string& url, const Json* body,
						 std::chrono::milliseconds timeout,
						 const std::vector<std::string>& extraHeaders = {}) const;
};

namespace Url
{
/// @brief Percent-encode everything outside the RFC 3986 unreserved set.
std::string Encode(std::string_view raw);
std::string Decode(std::string_view encoded);
/// @brief Value of the first `name` parameter in the URL's query, if any.
std::optional<std::string> QueryParameter(std::string_view url, std::string_view name);
}  // namespace Url

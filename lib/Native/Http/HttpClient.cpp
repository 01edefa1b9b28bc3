#include "HttpClient.hpp"

#include <curl/curl.h>

#include <stdexcept>

namespace
{
struct CurlGlobal
{
	CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
	~CurlGlobal() { curl_global_cleanup(); }
};
void EnsureCurlGlobal()
{
	static CurlGlobal instance;
}

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
	((std::string*)userp)->append((char*)contents, size * nmemb);
	return size * nmemb;
}
}  // namespace

CurlHttpClient::CurlHttpClient()
{
	EnsureCurlGlobal();
}

HttpResponse CurlHttpClient::Get(const std::string& url, std::chrono::milliseconds timeout)
{
	return request("GET", url, nullptr, timeout);
}

HttpResponse CurlHttpClient::PostJson(const std::string& url, const Json& body,
									  std::chrono::milliseconds timeout)
{
	return request("POST", url, &body, timeout, {"Content-Type: application/json"});
}

HttpResponse CurlHttpClient::request(const std::string& method, const std::string& url,
									 const Json* body, std::chrono::milliseconds timeout,
									 const std::vector<std::string>& extraHeaders) const
{
	CURL* curl = curl_easy_init();
	if (!curl)
	{
		throw std::runtime_error("Failed to init curl");
	}
	HttpResponse response;
	struct curl_slist* headers = nullptr;
	headers = curl_slist_append(headers, "Accept: application/json");
	for (auto& h : extraHeaders)
	{
		headers = curl_slist_append(headers, h.c_str());
	}

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	std::string bodyStr;
	if (body)
	{
		bodyStr = body->dump();
		curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, bodyStr.c_str());
	}

	CURLcode res = curl_easy_perform(curl);
	curl_slist_free_all(headers);
	if (res != CURLE_OK)
	{
		curl_easy_cleanup(curl);
		throw std::runtime_error(std::string("curl_easy_perform failed: ") +
								 curl_easy_strerror(res));
	}
	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
	curl_easy_cleanup(curl);
	return response;
}

namespace Url
{
std::string Encode(std::string_view raw)
{
	EnsureCurlGlobal();
	char* enc = curl_easy_escape(nullptr, raw.data(), static_cast<int>(raw.size()));
	if (!enc)
		throw std::runtime_error("curl_easy_escape failed");

	std::string encoded(enc);
	curl_free(enc);
	return encoded;
}

std::string Decode(std::string_view encoded)
{
	EnsureCurlGlobal();
	// Form-style '+' means space in query strings.
	std::string plus(encoded);
	std::replace(plus.begin(), plus.end(), '+', ' ');
	int outLen = 0;
	char* dec = curl_easy_unescape(nullptr, plus.c_str(), static_cast<int>(plus.size()), &outLen);
	if (!dec)
		throw std::runtime_error("curl_easy_unescape failed");
	std::string decoded(dec, static_cast<size_t>(outLen));
	curl_free(dec);
	return decoded;
}

std::optional<std::string> QueryParameter(std::string_view url, std::string_view name)
{
	const size_t q = url.find('?');
	if (q == std::string_view::npos)
		return std::nullopt;
	std::string_view query = url.substr(q + 1);
	if (const size_t hash = query.find('#'); hash != std::string_view::npos)
		query = query.substr(0, hash);

	while (!query.empty())
	{
		const size_t amp = query.find('&');
		const std::string_view pair = query.substr(0, amp);
		const size_t eq = pair.find('=');
		const std::string_view key = pair.substr(0, eq);
		if (Decode(key) == name)
		{
			return eq == std::string_view::npos ? std::string() : Decode(pair.substr(eq + 1));
		}
		if (amp == std::string_view::npos)
			break;
		query = query.substr(amp + 1);
	}
	return std::nullopt;
}
}  // namespace Url

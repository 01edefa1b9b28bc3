#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

// Strip control characters (except newline/tab) and trim surrounding whitespace.
inline std::string NukeString(std::string_view input)
{
	std::string out;
	out.reserve(input.size());

	for (unsigned char c : input)
	{
		if (c == '\0')
			continue;
		if (c < 32 && c != '\n' && c != '\r' && c != '\t')
			continue;

		out.push_back(static_cast<char>(c));
	}

	size_t start = 0;
	while (start < out.size() && std::isspace((unsigned char)out[start]))
		++start;

	size_t end = out.size();
	while (end > start && std::isspace((unsigned char)out[end - 1]))
		--end;

	return out.substr(start, end - start);
}

inline std::string Trim(std::string_view input)
{
	size_t start = 0;
	while (start < input.size() && std::isspace((unsigned char)input[start]))
		++start;
	size_t end = input.size();
	while (end > start && std::isspace((unsigned char)input[end - 1]))
		--end;
	return std::string(input.substr(start, end - start));
}

inline std::string ToLower(std::string_view input)
{
	std::string result(input);
	std::transform(result.begin(), result.end(), result.begin(),
				   [](unsigned char c) { return std::tolower(c); });
	return result;
}

inline bool StartsWith(std::string_view str, std::string_view prefix)
{
	return str.substr(0, prefix.size()) == prefix;
}

// Keep at most MaxChars characters, the way error details are shown to the user.
inline std::string Truncate(std::string_view input, size_t MaxChars)
{
	return std::string(input.substr(0, std::min(input.size(), MaxChars)));
}

inline std::vector<std::string> SplitLines(std::string_view input)
{
	std::vector<std::string> lines;
	size_t pos = 0;
	while (pos <= input.size())
	{
		const size_t next = input.find('\n', pos);
		std::string_view line = input.substr(pos, next == std::string_view::npos
													  ? std::string_view::npos
													  : next - pos);
		if (!line.empty() && line.back() == '\r')
			line.remove_suffix(1);
		if (!line.empty())
			lines.emplace_back(line);
		if (next == std::string_view::npos)
			break;
		pos = next + 1;
	}
	return lines;
}

inline std::string JoinStrings(const std::vector<std::string>& parts, std::string_view sep)
{
	std::string out;
	for (size_t i = 0; i < parts.size(); ++i)
	{
		if (i)
			out += sep;
		out += parts[i];
	}
	return out;
}

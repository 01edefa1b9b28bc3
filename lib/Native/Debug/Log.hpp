#pragma once
#include <cstdint>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>

/// @brief Tagged console logger. Every line is prefixed with "<tag>> " in a
/// colour picked per logger; warnings print yellow, errors red.
class Log
{
   public:
	enum class Level
	{
		Debug,
		Warning,
		Error,
	};

	Log() = default;
	explicit Log(const std::string &Who);

	std::string WhoIsTalking;

	void Debug(std::string_view str) const { Write(Level::Debug, str); }
	void Warning(std::string_view str) const { Write(Level::Warning, str); }
	void Error(std::string_view str) const { Write(Level::Error, str); }

	template <typename... Args>
	void DebugFormatted(std::string_view fmt, Args &&...args) const
	{
		WriteFormatted(Level::Debug, fmt, args...);
	}
	template <typename... Args>
	void WarningFormatted(std::string_view fmt, Args &&...args) const
	{
		WriteFormatted(Level::Warning, fmt, args...);
	}
	template <typename... Args>
	void ErrorFormatted(std::string_view fmt, Args &&...args) const
	{
		WriteFormatted(Level::Error, fmt, args...);
	}

	/// @brief Lines below this level are dropped (console and file).
	static void SetMinimumLevel(Level level);
	static bool IsEnabled(Level level);
	/// @brief Mirror every line, without colour codes, into the given file.
	/// An empty path closes the mirror.
	static void SetLogFile(const std::filesystem::path &path);

   private:
	// ANSI foreground colour index, 1 (red) to 6 (cyan).
	uint8_t tagColor = 7;

	void Write(Level level, std::string_view str) const;

	template <typename... Args>
	void WriteFormatted(Level level, std::string_view fmt, Args &...args) const
	{
		if (!IsEnabled(level))
			return;
		Write(level, std::vformat(fmt, std::make_format_args(args...)));
	}
};

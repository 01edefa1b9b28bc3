#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>
#include <random>

namespace
{
constexpr uint8_t kRed = 1;
constexpr uint8_t kYellow = 3;

std::atomic<Log::Level> MinimumLevel = Log::Level::Warning;
std::mutex OutputMutex;
std::ofstream LogFile;

std::string Color(uint8_t index)
{
	return std::format("\033[{}m", 30 + index);
}
const std::string kReset = "\033[0m";

uint8_t PickTagColor()
{
	// Red..cyan: black and white vanish on one terminal theme or the other.
	static std::mutex pickMutex;
	static std::mt19937 gen(std::random_device{}());
	static std::uniform_int_distribution<int> dist(1, 6);
	std::lock_guard lock(pickMutex);
	return static_cast<uint8_t>(dist(gen));
}

std::string Timestamp()
{
	const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
	return std::format("{:%Y-%m-%d %H:%M:%S}", now);
}

const char *LevelTag(Log::Level level)
{
	switch (level)
	{
	case Log::Level::Debug:
		return "DEBUG";
	case Log::Level::Warning:
		return "WARN";
	case Log::Level::Error:
		return "ERROR";
	}
	return "?";
}
}  // namespace

Log::Log(const std::string &Who) : WhoIsTalking(Who), tagColor(PickTagColor()) {}

void Log::SetMinimumLevel(Level level)
{
	MinimumLevel.store(level);
}

bool Log::IsEnabled(Level level)
{
	return level >= MinimumLevel.load();
}

void Log::SetLogFile(const std::filesystem::path &path)
{
	std::lock_guard lock(OutputMutex);
	if (LogFile.is_open())
		LogFile.close();
	if (path.empty())
		return;
	std::error_code ec;
	std::filesystem::create_directories(path.parent_path(), ec);
	LogFile.open(path, std::ios::app);
}

void Log::Write(Level level, std::string_view str) const
{
	if (!IsEnabled(level))
		return;

	std::string body(str);
	if (level == Level::Error)
		body = Color(kRed) + body + kReset;
	else if (level == Level::Warning)
		body = Color(kYellow) + body + kReset;

	std::lock_guard lock(OutputMutex);
	std::cerr << Color(tagColor) << WhoIsTalking << "> " << kReset << body << std::endl;
	if (LogFile.is_open())
	{
		LogFile << Timestamp() << ' ' << LevelTag(level) << ' ' << WhoIsTalking << "> " << str
				<< '\n';
		LogFile.flush();
	}
}

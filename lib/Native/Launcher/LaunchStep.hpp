#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

#include "Launcher/LauncherEnums.hpp"

/// @brief One write-once entry of the launch audit trail.
class LaunchStep
{
	StepStatus status = StepStatus::ePending;
	std::string message;
	std::chrono::system_clock::time_point at;

   public:
	LaunchStep(StepStatus _status, std::string _message)
		: status(_status), message(std::move(_message)), at(std::chrono::system_clock::now())
	{
	}

	StepStatus Status() const { return status; }
	const std::string& Message() const { return message; }
	std::chrono::system_clock::time_point At() const { return at; }
};

/// @brief Append-only step log capped at Capacity entries, oldest evicted first.
class StepLog
{
	std::deque<LaunchStep> entries;

   public:
	static constexpr size_t Capacity = 50;

	void Append(StepStatus status, std::string message)
	{
		entries.emplace_back(status, std::move(message));
		while (entries.size() > Capacity) entries.pop_front();
	}
	void Clear() { entries.clear(); }

	const std::deque<LaunchStep>& Entries() const { return entries; }
	size_t Size() const { return entries.size(); }
	bool Empty() const { return entries.empty(); }
};

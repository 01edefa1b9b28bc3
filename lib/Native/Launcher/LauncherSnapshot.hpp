#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "Launcher/LaunchStep.hpp"
#include "Launcher/LauncherEnums.hpp"

struct LauncherErrorInfo
{
	LauncherErrorType Type = LauncherErrorType::eUnexpected;
	std::string Message;
	RemediationAction Remediation = RemediationAction::eNone;
};

/// @brief Copy of everything the orchestrator publishes. Observers only ever
/// see these, never the live state.
struct LauncherSnapshot
{
	/// Steps a full first-run launch appends as done.
	static constexpr int ExpectedSteps = 8;

	LauncherState State = LauncherState::eIdle;
	MenuBarStatus MenuBar = MenuBarStatus::eStopped;
	StepLog Steps;
	std::optional<std::string> GatewayToken;
	uint16_t Port = 0;
	bool GatewayHealthy = false;
	std::optional<int64_t> GatewayUptime;
	std::optional<std::chrono::system_clock::time_point> ContainerStartTime;
	uint64_t UptimeTick = 0;
	std::optional<std::string> PullProgressText;
	std::optional<std::string> AuthExpiredBanner;
	std::optional<LauncherErrorInfo> LastError;
	AuthInputKind AuthInput = AuthInputKind::eNone;
	std::optional<std::string> AuthorizeURL;

	/// @brief Message of the last step still running.
	std::optional<std::string> CurrentStep() const
	{
		const auto& entries = Steps.Entries();
		for (auto it = entries.rbegin(); it != entries.rend(); ++it)
			if (it->Status() == StepStatus::eRunning)
				return it->Message();
		return std::nullopt;
	}
	int CompletedSteps() const
	{
		int count = 0;
		for (const auto& step : Steps.Entries())
			if (step.Status() == StepStatus::eDone)
				++count;
		return count;
	}
	double Progress() const
	{
		return std::min(1.0, static_cast<double>(CompletedSteps()) / ExpectedSteps);
	}
	/// @brief HH:MM:SS since the container start, "00:00:00" when not started.
	std::string UptimeString(
		std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
};

#pragma once

#include <stdexcept>
#include <string>

#include "Launcher/LauncherEnums.hpp"

/// @brief Typed failure of a launch attempt. Raised inside the orchestrator and
/// turned into an error step plus the error state at its boundary.
class LauncherError : public std::runtime_error
{
	LauncherErrorType type;
	std::string detail;
	RemediationAction remediation;

   public:
	/// Characters of captured stderr kept in user-facing messages.
	static constexpr size_t DetailLimit = 200;

	LauncherError(LauncherErrorType _type, std::string _detail = {});

	LauncherErrorType Type() const { return type; }
	const std::string& Detail() const { return detail; }
	RemediationAction Remediation() const { return remediation; }

	static std::string Describe(LauncherErrorType type, const std::string& detail);
};

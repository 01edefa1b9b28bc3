#include "LauncherError.hpp"

#include <format>

#include "Global/Misc/String_utils.hpp"

namespace
{
RemediationAction RemediationFor(LauncherErrorType type)
{
	switch (type)
	{
	case LauncherErrorType::eEngineNotInstalled:
		return RemediationAction::eOpenDownloadPage;
	case LauncherErrorType::eEngineNotRunning:
		return RemediationAction::eOpenEngineApp;
	default:
		return RemediationAction::eNone;
	}
}
}  // namespace

LauncherError::LauncherError(LauncherErrorType _type, std::string _detail)
	: std::runtime_error(Describe(_type, _detail)),
	  type(_type),
	  detail(std::move(_detail)),
	  remediation(RemediationFor(_type))
{
}

std::string LauncherError::Describe(LauncherErrorType type, const std::string& detail)
{
	const std::string shortDetail = Truncate(Trim(detail), DetailLimit);
	switch (type)
	{
	case LauncherErrorType::eEngineNotInstalled:
		return "Docker Desktop is required. Please install it and try again.";
	case LauncherErrorType::eEngineNotRunning:
		return "Docker Desktop is not running. Please start it and try again.";
	case LauncherErrorType::eImagePullFailed:
		return std::format("Failed to pull Docker image: {}", shortDetail);
	case LauncherErrorType::eContainerStartFailed:
		return std::format("Failed to start container: {}", shortDetail);
	case LauncherErrorType::eNoSecretAvailable:
		return "Gateway token not generated. Try resetting: rm -rf ~/.openclaw-launcher";
	case LauncherErrorType::eUnexpected:
		break;
	}
	return shortDetail.empty() ? std::string("Unexpected error") : shortDetail;
}

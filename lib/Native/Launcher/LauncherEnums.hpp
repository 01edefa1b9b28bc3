#pragma once

#include <boost/describe/enum.hpp>

enum class LauncherState
{
	eIdle,
	eWorking,
	eNeedsAuth,			   // first run, no credentials yet
	eWaitingForAuthInput,  // browser opened or API key field shown
	eRunning,
	eStopped,
	eError,
};
BOOST_DESCRIBE_ENUM(LauncherState, eIdle, eWorking, eNeedsAuth, eWaitingForAuthInput, eRunning,
					eStopped, eError);

enum class StepStatus
{
	ePending,
	eRunning,
	eDone,
	eError,
	eWarning,
};
BOOST_DESCRIBE_ENUM(StepStatus, ePending, eRunning, eDone, eError, eWarning);

enum class MenuBarStatus
{
	eStarting,
	eRunning,
	eStopped,
};
BOOST_DESCRIBE_ENUM(MenuBarStatus, eStarting, eRunning, eStopped);

enum class AuthInputKind
{
	eNone,
	eOAuthCode,
	eApiKey,
};
BOOST_DESCRIBE_ENUM(AuthInputKind, eNone, eOAuthCode, eApiKey);

enum class LauncherErrorType
{
	eEngineNotInstalled,
	eEngineNotRunning,
	eImagePullFailed,
	eContainerStartFailed,
	eNoSecretAvailable,
	eUnexpected,
};
BOOST_DESCRIBE_ENUM(LauncherErrorType, eEngineNotInstalled, eEngineNotRunning, eImagePullFailed,
					eContainerStartFailed, eNoSecretAvailable, eUnexpected);

enum class RemediationAction
{
	eNone,
	eOpenDownloadPage,
	eOpenEngineApp,
};
BOOST_DESCRIBE_ENUM(RemediationAction, eNone, eOpenDownloadPage, eOpenEngineApp);

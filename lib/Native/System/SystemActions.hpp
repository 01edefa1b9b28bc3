#pragma once
#include <string>

#include "Command/CommandRunner.hpp"
#include "Debug/Log.hpp"

/// @brief Desktop side effects the launcher triggers but never observes.
class ISystemActions
{
   public:
	virtual ~ISystemActions() = default;

	/// @return false if the request could not be handed to the desktop.
	virtual bool OpenURL(const std::string& url) = 0;
	/// @brief Start the container engine's desktop application.
	virtual bool LaunchEngineApp(const std::string& appPath) = 0;
};

class DesktopSystemActions : public ISystemActions
{
	ICommandRunner& runner;
	Log logger = Log("SystemActions");

   public:
	explicit DesktopSystemActions(ICommandRunner& _runner) : runner(_runner) {}

	bool OpenURL(const std::string& url) override;
	bool LaunchEngineApp(const std::string& appPath) override;
};

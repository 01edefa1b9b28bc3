#include "Launcher.hpp"

#include <cstdlib>
#include <format>
#include <iostream>

#include "Command/CommandRunner.hpp"
#include "Docker/DockerCli.hpp"
#include "Docker/DockerPaths.hpp"
#include "Global/Misc/String_utils.hpp"
#include "Http/HttpClient.hpp"
#include "State/StateStore.hpp"
#include "System/SystemActions.hpp"

namespace fs = std::filesystem;

namespace
{
const char* StepGlyph(StepStatus status)
{
	switch (status)
	{
	case StepStatus::ePending:
		return "[  ]";
	case StepStatus::eRunning:
		return "[..]";
	case StepStatus::eDone:
		return "[ok]";
	case StepStatus::eWarning:
		return "[!!]";
	case StepStatus::eError:
		return "[xx]";
	}
	return "[??]";
}

bool IsKnownCommand(const std::string& command)
{
	for (const char* known : {"start", "stop", "restart", "reset", "reauth", "status", "logs"})
		if (command == known)
			return true;
	return false;
}
}  // namespace

void Launcher::PrintUsage()
{
	std::cout << "Usage: OpenClawLauncher [--state-dir <dir>] [--no-browser] [--debug] [command]\n"
				 "\n"
				 "Commands:\n"
				 "  start    bring OpenClaw up and supervise it (default)\n"
				 "  stop     stop the container\n"
				 "  restart  restart the container\n"
				 "  reset    remove the container and all local state\n"
				 "  reauth   forget stored credentials and sign in again\n"
				 "  status   show engine, container and configuration status\n"
				 "  logs     print the last 300 lines of the container log\n";
}

std::optional<Launcher::CommandLine> Launcher::Parse(const std::vector<std::string>& args)
{
	CommandLine cmd;
	bool haveCommand = false;
	for (size_t i = 0; i < args.size(); ++i)
	{
		const std::string& arg = args[i];
		if (arg == "--state-dir")
		{
			if (i + 1 >= args.size())
			{
				std::cerr << "--state-dir needs a directory\n";
				PrintUsage();
				return std::nullopt;
			}
			cmd.StateDir = fs::path(args[++i]);
		}
		else if (arg == "--no-browser")
		{
			cmd.NoBrowser = true;
		}
		else if (arg == "--debug")
		{
			cmd.Debug = true;
		}
		else if (arg == "-h" || arg == "--help")
		{
			cmd.Command = "help";
			haveCommand = true;
		}
		else if (!haveCommand && IsKnownCommand(arg))
		{
			cmd.Command = arg;
			haveCommand = true;
		}
		else
		{
			std::cerr << "Unknown argument '" << arg << "'\n";
			PrintUsage();
			return std::nullopt;
		}
	}
	return cmd;
}

int Launcher::Run(const CommandLine& cmd)
{
	if (cmd.Command == "help")
	{
		PrintUsage();
		return 0;
	}

	const char* homeEnv = std::getenv("HOME");
	if (homeEnv == nullptr || *homeEnv == '\0')
	{
		logger.Error("HOME is not set");
		return 1;
	}
	const fs::path home = homeEnv;

	StatePaths paths = StatePaths::ForHome(home);
	std::optional<fs::path> root = cmd.StateDir;
	if (!root)
	{
		const char* overrideEnv = std::getenv("OPENCLAW_LAUNCHER_HOME");
		if (overrideEnv != nullptr && *overrideEnv != '\0')
			root = fs::path(overrideEnv);
	}
	if (root)
	{
		paths.Root = *root;
		paths.LegacyRoot.clear();
	}

	LauncherOptions options = LauncherOptions::ForStateDir(home, paths);
	if (cmd.NoBrowser)
		options.Settings.openBrowserOnStart = false;
	Log::SetMinimumLevel(cmd.Debug || options.Settings.debugMode ? Log::Level::Debug
																 : Log::Level::Warning);
	// Creating the root here would defeat the legacy-directory migration.
	std::error_code ec;
	if (fs::exists(paths.Root, ec))
		Log::SetLogFile(paths.LogFile());

	ProcessCommandRunner runner(DockerPaths::MakeCommandEnvironment(options.EngineSearch));
	if (cmd.Command == "status")
		return RunStatus(options, runner);

	CurlHttpClient http;
	DesktopSystemActions system(runner);
	LaunchOrchestrator orchestrator(options, runner, http, system);
	orchestrator.Subscribe(
		[this](const LauncherSnapshot& snap)
		{
			Render(snap);
			{
				std::lock_guard lock(changeMutex);
				++changeCount;
			}
			changeCv.notify_all();
		});

	if (cmd.Command == "logs")
	{
		std::cout << orchestrator.FetchLogs() << std::endl;
		return 0;
	}
	if (cmd.Command == "stop")
	{
		orchestrator.StopContainer();
		orchestrator.WaitForIdle();
		std::cout << "Stopped.\n";
		return orchestrator.GetSnapshot().State == LauncherState::eStopped ? 0 : 1;
	}
	if (cmd.Command == "reset")
	{
		orchestrator.ResetEverything();
		orchestrator.WaitForIdle();
		const LauncherSnapshot snap = orchestrator.GetSnapshot();
		if (snap.State != LauncherState::eStopped)
		{
			PrintError(snap);
			return 1;
		}
		std::cout << "Removed the container and " << paths.Root.string() << "\n";
		return 0;
	}
	if (cmd.Command == "restart")
	{
		// A fresh process starts idle; adopt the running container first.
		orchestrator.Start();
		orchestrator.WaitForIdle();
		if (orchestrator.GetSnapshot().State != LauncherState::eRunning)
			return Supervise(orchestrator);
		orchestrator.RestartContainer();
		orchestrator.WaitForIdle();
		const LauncherSnapshot snap = orchestrator.GetSnapshot();
		if (snap.State != LauncherState::eRunning)
		{
			PrintError(snap);
			return 1;
		}
		return 0;
	}
	if (cmd.Command == "reauth")
	{
		orchestrator.ReAuthenticate();
		return Supervise(orchestrator);
	}

	orchestrator.Start();
	return Supervise(orchestrator);
}

int Launcher::Supervise(LaunchOrchestrator& orchestrator)
{
	uint64_t seen = 0;
	bool announced = false;
	while (!shutdownRequested.load())
	{
		WaitForChange(seen);
		if (orchestrator.IsOperationInFlight())
			continue;

		const LauncherSnapshot snap = orchestrator.GetSnapshot();
		switch (snap.State)
		{
		case LauncherState::eNeedsAuth:
		case LauncherState::eWaitingForAuthInput:
			announced = false;
			PromptForAuth(orchestrator, snap);
			break;
		case LauncherState::eRunning:
			if (!announced)
			{
				std::cout << "\nOpenClaw is running: " << orchestrator.BrowserURL()
						  << "\nPress Ctrl+C to stop supervising (the container keeps running).\n"
						  << std::flush;
				announced = true;
			}
			break;
		case LauncherState::eError:
			PrintError(snap);
			return 1;
		case LauncherState::eStopped:
			std::cout << "Stopped.\n";
			return 0;
		case LauncherState::eIdle:
		case LauncherState::eWorking:
			break;
		}
	}
	std::cout << "\nSupervision ended. Use 'OpenClawLauncher stop' to stop the container.\n";
	return 0;
}

void Launcher::WaitForChange(uint64_t& seen)
{
	std::unique_lock lock(changeMutex);
	changeCv.wait_for(lock, std::chrono::milliseconds(250), [&] { return changeCount != seen; });
	seen = changeCount;
}

void Launcher::PromptForAuth(LaunchOrchestrator& orchestrator, const LauncherSnapshot& snap)
{
	std::string line;
	if (snap.State == LauncherState::eWaitingForAuthInput &&
		snap.AuthInput == AuthInputKind::eOAuthCode)
	{
		std::cout << "\nSign in at:\n  " << snap.AuthorizeURL.value_or("") << "\n"
				  << "Paste the authorization code or the full callback URL: " << std::flush;
		if (!std::getline(std::cin, line))
		{
			orchestrator.SkipAuth();
			return;
		}
		orchestrator.SubmitOAuthCode(line);
		return;
	}
	if (snap.State == LauncherState::eWaitingForAuthInput &&
		snap.AuthInput == AuthInputKind::eApiKey)
	{
		std::cout << "\nAnthropic API key (empty to skip): " << std::flush;
		if (!std::getline(std::cin, line))
			line.clear();
		orchestrator.SubmitApiKey(line);
		return;
	}

	std::cout << "\nChoose how to sign in:\n"
				 "  oauth        sign in with your Claude account\n"
				 "  key <value>  use an Anthropic API key\n"
				 "  skip         set it up later in the Control UI\n"
				 "> "
			  << std::flush;
	if (!std::getline(std::cin, line))
	{
		orchestrator.SkipAuth();
		return;
	}
	const std::string choice = Trim(line);
	if (choice == "oauth")
		orchestrator.StartOAuth();
	else if (choice == "key")
		orchestrator.ShowApiKeyInput();
	else if (StartsWith(choice, "key "))
		orchestrator.SubmitApiKey(choice.substr(4));
	else if (choice == "skip")
		orchestrator.SkipAuth();
	else
		std::cout << "Unknown choice '" << choice << "'\n";
}

void Launcher::Render(const LauncherSnapshot& snap)
{
	const auto& entries = snap.Steps.Entries();
	size_t first = 0;
	if (lastStepAt && lastStepMessage)
	{
		for (size_t i = entries.size(); i-- > 0;)
		{
			if (entries[i].At() == *lastStepAt && entries[i].Message() == *lastStepMessage)
			{
				first = i + 1;
				break;
			}
		}
	}
	for (size_t i = first; i < entries.size(); ++i)
		std::cout << StepGlyph(entries[i].Status()) << ' ' << entries[i].Message() << '\n';
	if (!entries.empty())
	{
		lastStepAt = entries.back().At();
		lastStepMessage = entries.back().Message();
	}

	if (snap.PullProgressText && snap.PullProgressText != lastProgress)
		std::cout << "     " << *snap.PullProgressText << '\n';
	lastProgress = snap.PullProgressText;

	if (snap.State == LauncherState::eRunning)
	{
		if (lastHealthy != snap.GatewayHealthy && snap.GatewayHealthy)
			std::cout << "     Gateway healthy\n";
		else if (lastHealthy.value_or(false) && !snap.GatewayHealthy)
			std::cout << "     Gateway not responding\n";
		lastHealthy = snap.GatewayHealthy;
	}
	else
	{
		lastHealthy.reset();
	}
	std::cout << std::flush;
}

void Launcher::PrintError(const LauncherSnapshot& snap)
{
	std::cerr << "\nLaunch failed: "
			  << (snap.LastError ? snap.LastError->Message : std::string("unknown error")) << "\n";
	if (!snap.LastError)
		return;
	switch (snap.LastError->Remediation)
	{
	case RemediationAction::eOpenDownloadPage:
		std::cerr << "Install Docker Desktop from https://www.docker.com/products/docker-desktop/ "
					 "and run again.\n";
		break;
	case RemediationAction::eOpenEngineApp:
		std::cerr << "Start Docker Desktop (or your container engine) and run again.\n";
		break;
	case RemediationAction::eNone:
		break;
	}
}

int Launcher::RunStatus(const LauncherOptions& options, ICommandRunner& runner)
{
	DockerCli docker(runner, options.EngineBinary);
	StateStore store(options.Paths);

	const auto env = store.ReadEnvironment();
	const auto binary = DockerPaths::FindEngineBinary(options.EngineSearch);
	const bool daemon = docker.IsDaemonResponding();
	const bool running = daemon && docker.IsContainerRunning(options.ContainerName);

	std::string credentials = "none";
	if (store.HasOAuthCredentials())
		credentials = "Claude account (OAuth)";
	else if (store.HasApiKeyProfile())
		credentials = "API key";

	std::cout << std::format("State directory : {}\n", options.Paths.Root.string())
			  << std::format("Configured      : {}\n", env ? "yes" : "no")
			  << std::format("Credentials     : {}\n", credentials)
			  << std::format("Engine CLI      : {}\n",
							 binary ? std::format("{} ({})", binary->Path, binary->Backend)
									: std::string("not found"))
			  << std::format("Engine daemon   : {}\n", daemon ? "responding" : "not responding")
			  << std::format("Container       : {}\n", running ? "running" : "not running");
	if (env && env->Port != 0)
		std::cout << std::format("Control UI      : http://localhost:{}{}\n", env->Port,
								 options.GatewayBasePath);
	return running ? 0 : 3;
}

#include "LaunchOrchestrator.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <stdexcept>
#include <vector>

#include "Docker/DockerPaths.hpp"
#include "Global/Misc/String_utils.hpp"
#include "Global/pch.hpp"
#include "Network/PortAllocator.hpp"

namespace
{
constexpr size_t kPullProgressChars = 80;

bool IsPullProgressLine(std::string_view line)
{
	static constexpr std::array<std::string_view, 8> keywords = {
		"Pulling",	 "Downloading",	   "Extracting", "Verifying",
		"Pull complete", "Already exists", "Digest",	 "Status",
	};
	return std::any_of(keywords.begin(), keywords.end(), [line](std::string_view keyword)
					   { return line.find(keyword) != std::string_view::npos; });
}

std::string FirstNonEmpty(const CommandResult& result, const std::string& fallback)
{
	const std::string err = Trim(result.stderr_text);
	if (!err.empty())
		return err;
	const auto lines = SplitLines(result.stdout_text);
	if (!lines.empty())
		return Trim(lines.back());
	return fallback;
}
}  // namespace

LaunchOrchestrator::LaunchOrchestrator(LauncherOptions _options, ICommandRunner& _runner,
									   IHttpClient& _http, ISystemActions& _system)
	: options(std::move(_options)),
	  http(_http),
	  system(_system),
	  docker(_runner, options.EngineBinary),
	  store(options.Paths),
	  oauth(_http)
{
	snapshot.Port = options.Settings.port;
}

LaunchOrchestrator::~LaunchOrchestrator()
{
	worker.Shutdown();
	healthTask.reset();
	uptimeTask.reset();
}

//=================================
//===      PUBLIC ENTRIES       ===
//=================================
void LaunchOrchestrator::Start()
{
	if (!TryBeginOperation({LauncherState::eIdle, LauncherState::eRunning, LauncherState::eStopped,
							LauncherState::eError}))
		return;
	PostOperation("start", [this] { RunStart(); });
}

void LaunchOrchestrator::StopContainer()
{
	if (!TryBeginOperation({}))
		return;
	PostOperation("stop", [this] { RunStop(); });
}

void LaunchOrchestrator::RestartContainer()
{
	if (!TryBeginOperation({LauncherState::eRunning, LauncherState::eStopped, LauncherState::eError}))
		return;
	PostOperation("restart", [this] { RunRestart(); });
}

void LaunchOrchestrator::ResetEverything()
{
	if (!TryBeginOperation({}))
		return;
	PostOperation("reset", [this] { RunReset(); });
}

void LaunchOrchestrator::ReAuthenticate()
{
	if (!TryBeginOperation({}))
		return;
	PostOperation("reauthenticate", [this] { RunReAuthenticate(); });
}

void LaunchOrchestrator::StartOAuth()
{
	if (!TryBeginOperation({LauncherState::eNeedsAuth, LauncherState::eWaitingForAuthInput}))
		return;
	PostOperation("oauth", [this] { RunStartOAuth(); });
}

void LaunchOrchestrator::ShowApiKeyInput()
{
	if (!TryBeginOperation({LauncherState::eNeedsAuth, LauncherState::eWaitingForAuthInput}))
		return;
	PostOperation("api key input",
				  [this]
				  {
					  Mutate(
						  [](LauncherSnapshot& s)
						  {
							  s.State = LauncherState::eWaitingForAuthInput;
							  s.AuthInput = AuthInputKind::eApiKey;
							  s.AuthorizeURL.reset();
						  });
				  });
}

void LaunchOrchestrator::SubmitApiKey(const std::string& key)
{
	if (!TryBeginOperation({LauncherState::eNeedsAuth, LauncherState::eWaitingForAuthInput}))
		return;
	PostOperation("api key", [this, key] { RunSubmitApiKey(key); });
}

void LaunchOrchestrator::SubmitOAuthCode(const std::string& input)
{
	if (!TryBeginOperation({LauncherState::eNeedsAuth, LauncherState::eWaitingForAuthInput}))
		return;
	PostOperation("oauth code", [this, input] { RunSubmitOAuthCode(input); });
}

void LaunchOrchestrator::SkipAuth()
{
	if (!TryBeginOperation({LauncherState::eNeedsAuth, LauncherState::eWaitingForAuthInput}))
		return;
	PostOperation("skip auth", [this] { RunSkipAuth(); });
}

bool LaunchOrchestrator::TryBeginOperation(std::initializer_list<LauncherState> allowed)
{
	bool expected = false;
	if (!operationInFlight.compare_exchange_strong(expected, true))
	{
		logger.Debug("Operation already in flight, request ignored");
		return false;
	}
	if (allowed.size() == 0)
		return true;

	const LauncherState current = GetSnapshot().State;
	if (std::find(allowed.begin(), allowed.end(), current) == allowed.end())
	{
		logger.DebugFormatted("Request ignored in state {}", EnumToString(current));
		operationInFlight = false;
		return false;
	}
	return true;
}

void LaunchOrchestrator::PostOperation(std::string name, std::function<void()> body)
{
	worker.Post(
		[this, name = std::move(name), body = std::move(body)]
		{
			logger.DebugFormatted("Operation '{}' started", name);
			try
			{
				body();
			}
			catch (const LauncherError& e)
			{
				Fail(e);
			}
			catch (const std::exception& e)
			{
				Fail(LauncherError(LauncherErrorType::eUnexpected, e.what()));
			}
			logger.DebugFormatted("Operation '{}' finished in state {}", name,
								  EnumToString(GetSnapshot().State));
			operationInFlight = false;
		});
}

void LaunchOrchestrator::WaitForIdle()
{
	worker.WaitIdle();
}

//=================================
//===          START            ===
//=================================
void LaunchOrchestrator::RunStart()
{
	StopSupervision();
	isFirstRun = false;
	Mutate(
		[](LauncherSnapshot& s)
		{
			s.Steps.Clear();
			s.State = LauncherState::eWorking;
			s.MenuBar = MenuBarStatus::eStarting;
			s.LastError.reset();
			s.GatewayHealthy = false;
			s.GatewayUptime.reset();
			s.AuthInput = AuthInputKind::eNone;
			s.AuthorizeURL.reset();
		});

	// Ground truth from the engine on every start: a container left running by
	// a previous launcher process is adopted as is.
	if (TryRecoverRunningContainer())
		return;

	CheckEngine();
	FirstRunSetup();
	RefreshOAuthIfNeeded();

	if (isFirstRun && !store.HasApiKeyProfile() && !store.HasOAuthCredentials())
	{
		logger.Debug("First run without credentials, waiting for an auth choice");
		SetState(LauncherState::eNeedsAuth, MenuBarStatus::eStarting);
		return;
	}

	ContinueAfterSetup();
}

bool LaunchOrchestrator::TryRecoverRunningContainer()
{
	if (!docker.IsDaemonResponding() || !docker.IsContainerRunning(options.ContainerName))
		return false;

	store.MigrateLegacyDirectoryIfPresent();
	LoadGatewayEnvironment();
	AddStep(StepStatus::eDone, "Recovered running container");
	MarkRunning();
	return true;
}

void LaunchOrchestrator::CheckEngine()
{
	AddStep(StepStatus::eRunning, "Checking Docker...");

	const auto binary = DockerPaths::FindEngineBinary(options.EngineSearch);
	const auto app = DockerPaths::FindInstalledApp(options.EngineSearch);
	if (!binary && !app)
		throw LauncherError(LauncherErrorType::eEngineNotInstalled);
	if (binary)
		logger.DebugFormatted("Found {} CLI at {}", binary->Backend, binary->Path);

	if (docker.IsDaemonResponding())
	{
		AddStep(StepStatus::eDone, "Docker is ready");
		return;
	}

	const std::string backend = app ? app->Backend : binary->Backend;
	AddStep(StepStatus::eWarning, std::format("Docker not running. Starting {}...", backend));
	if (app && !options.SuppressSideEffects && !system.LaunchEngineApp(app->Path))
		logger.WarningFormatted("Could not launch {}, waiting for the daemon anyway", app->Path);

	for (int attempt = 0; attempt < options.EngineRetryCount; ++attempt)
	{
		Sleep(options.EngineRetryDelay);
		if (docker.IsDaemonResponding())
		{
			AddStep(StepStatus::eDone, "Docker is ready");
			return;
		}
	}
	throw LauncherError(LauncherErrorType::eEngineNotRunning);
}

void LaunchOrchestrator::FirstRunSetup()
{
	store.MigrateLegacyDirectoryIfPresent();
	if (!store.EnvFileExists())
		AddStep(StepStatus::eRunning, "First-time setup...");

	const StateStore::InitResult result = store.LoadOrInitialize(
		[this] { return PortAllocator::Choose(options.Settings.port, options.Settings.randomizePort); });
	isFirstRun = result.FirstRun;

	Mutate(
		[&](LauncherSnapshot& s)
		{
			if (result.Env.Token.empty())
				s.GatewayToken.reset();
			else
				s.GatewayToken = result.Env.Token;
			s.Port = result.Env.Port != 0 ? result.Env.Port : options.Settings.port;
		});
	AddStep(StepStatus::eDone,
			isFirstRun ? "Configuration created" : "Loaded existing configuration");
}

void LaunchOrchestrator::RefreshOAuthIfNeeded()
{
	const auto creds = store.ReadOAuthCredentials();
	if (!creds || !creds->IsExpired(NowEpochMs()))
		return;

	try
	{
		const OAuthCredentials refreshed = oauth.RefreshAccessToken(creds->Refresh);
		store.WriteOAuthCredentials(refreshed);
		AddStep(StepStatus::eDone, "OAuth token refreshed");
		Mutate([](LauncherSnapshot& s) { s.AuthExpiredBanner.reset(); });
	}
	catch (const std::exception& e)
	{
		logger.WarningFormatted("OAuth refresh failed: {}", e.what());
		Mutate([](LauncherSnapshot& s)
			   { s.AuthExpiredBanner = "Auth expired. Re-authenticate in the Control UI."; });
		AddStep(StepStatus::eWarning, "OAuth token expired (refresh failed)");
	}
}

void LaunchOrchestrator::ContinueAfterSetup()
{
	EnsureImage();
	RunContainer();
	WaitForGateway();

	MarkRunning();
	if (options.Settings.openBrowserOnStart)
		RunOpenBrowser();
}

void LaunchOrchestrator::EnsureImage()
{
	const std::string image = options.Settings.dockerImage;
	AddStep(StepStatus::eRunning, "Pulling image...");
	Mutate([](LauncherSnapshot& s) { s.PullProgressText = "Connecting..."; });

	const CommandResult pull = docker.PullImage(
		image,
		[this](std::string_view line)
		{
			const std::string trimmed = Trim(line);
			if (trimmed.empty() || !IsPullProgressLine(trimmed))
				return;
			Mutate([&](LauncherSnapshot& s)
				   { s.PullProgressText = Truncate(trimmed, kPullProgressChars); });
		});

	Mutate([](LauncherSnapshot& s) { s.PullProgressText.reset(); });

	if (pull.Succeeded())
	{
		AddStep(StepStatus::eDone, "Docker image up to date");
		return;
	}

	logger.WarningFormatted("Pull of {} exited with {}", image, pull.exit_code);
	if (docker.ImageExists(image))
	{
		AddStep(StepStatus::eWarning, "Couldn't check for updates (offline?). Using cached image.");
		return;
	}
	throw LauncherError(LauncherErrorType::eImagePullFailed,
						FirstNonEmpty(pull, "Image pull failed"));
}

void LaunchOrchestrator::RunContainer()
{
	const LauncherSnapshot current = GetSnapshot();
	if (!current.GatewayToken || current.GatewayToken->empty())
		throw LauncherError(LauncherErrorType::eNoSecretAvailable);

	if (docker.IsContainerRunning(options.ContainerName))
	{
		AddStep(StepStatus::eDone, "Container already running");
		return;
	}

	const CommandResult removed = docker.RemoveContainer(options.ContainerName);
	if (!removed.Succeeded())
		logger.DebugFormatted("Nothing to remove before run: {}", Trim(removed.stderr_text));

	AddStep(StepStatus::eRunning, "Starting container (lockdown mode)...");
	const CommandResult run = docker.RunContainer(MakeRunSpec(current.Port));
	if (!run.Succeeded())
	{
		throw LauncherError(LauncherErrorType::eContainerStartFailed,
							FirstNonEmpty(run, std::format("exit code {}", run.exit_code)));
	}
	AddStep(StepStatus::eDone, "Container started (locked down)");
}

void LaunchOrchestrator::WaitForGateway()
{
	AddStep(StepStatus::eRunning, "Waiting for Gateway to be ready...");

	const std::string url = GatewayURL("/");
	for (int attempt = 0; attempt < options.GatewayRetryCount; ++attempt)
	{
		Sleep(options.GatewayRetryDelay);
		try
		{
			if (http.Get(url, options.HealthProbeTimeout).Ok())
			{
				AddStep(StepStatus::eDone, "Gateway is ready!");
				return;
			}
		}
		catch (const std::exception& e)
		{
			logger.DebugFormatted("Gateway not reachable yet: {}", e.what());
		}
	}
	// Slow first boot is common; the browser can still be opened by hand.
	AddStep(StepStatus::eWarning, "Gateway is still starting. Try opening the browser anyway.");
}

//=================================
//===     OTHER LIFECYCLE       ===
//=================================
void LaunchOrchestrator::RunStop()
{
	StopSupervision();
	AddStep(StepStatus::eRunning, "Stopping OpenClaw...");
	const CommandResult result = docker.StopContainer(options.ContainerName);
	if (!result.Succeeded())
		logger.WarningFormatted("Stop exited with {}: {}", result.exit_code,
								Trim(result.stderr_text));
	AddStep(StepStatus::eDone, "Stopped.");

	Mutate(
		[](LauncherSnapshot& s)
		{
			s.Steps.Clear();
			s.State = LauncherState::eStopped;
			s.MenuBar = MenuBarStatus::eStopped;
			s.ContainerStartTime.reset();
			s.UptimeTick = 0;
			s.GatewayHealthy = false;
			s.GatewayUptime.reset();
			s.AuthInput = AuthInputKind::eNone;
			s.AuthorizeURL.reset();
		});
}

void LaunchOrchestrator::RunRestart()
{
	StopSupervision();
	AddStep(StepStatus::eRunning, "Restarting...");
	Mutate(
		[](LauncherSnapshot& s)
		{
			s.MenuBar = MenuBarStatus::eStarting;
			s.GatewayHealthy = false;
			s.UptimeTick = 0;
		});

	const CommandResult result = docker.RestartContainer(options.ContainerName);
	if (!result.Succeeded())
	{
		const std::string detail =
			Truncate(FirstNonEmpty(result, std::format("exit code {}", result.exit_code)),
					 LauncherError::DetailLimit);
		AddStep(StepStatus::eError, std::format("Failed to restart: {}", detail));
		Mutate(
			[&](LauncherSnapshot& s)
			{
				s.State = LauncherState::eError;
				s.MenuBar = MenuBarStatus::eStopped;
				s.LastError = LauncherErrorInfo{LauncherErrorType::eContainerStartFailed,
												std::format("Failed to restart: {}", detail),
												RemediationAction::eNone};
			});
		return;
	}
	AddStep(StepStatus::eDone, "Restarted");
	MarkRunning();
}

void LaunchOrchestrator::RunReset()
{
	StopSupervision();
	AddStep(StepStatus::eRunning, "Stopping container...");
	const CommandResult stopped = docker.StopContainer(options.ContainerName);
	if (!stopped.Succeeded())
		logger.DebugFormatted("Stop before reset exited with {}", stopped.exit_code);
	const CommandResult removed = docker.RemoveContainer(options.ContainerName);
	if (!removed.Succeeded())
		logger.DebugFormatted("Remove before reset exited with {}", removed.exit_code);
	AddStep(StepStatus::eDone, "Container removed");

	store.DeleteAll();
	AddStep(StepStatus::eDone, "Local config cleaned up");

	isFirstRun = false;
	pendingPKCE.reset();
	consecutiveFailures = 0;
	Mutate(
		[this](LauncherSnapshot& s)
		{
			s = LauncherSnapshot{};
			s.Port = options.Settings.port;
			s.State = LauncherState::eStopped;
			s.MenuBar = MenuBarStatus::eStopped;
		});
}

void LaunchOrchestrator::RunReAuthenticate()
{
	StopSupervision();
	if (docker.IsContainerRunning(options.ContainerName))
	{
		AddStep(StepStatus::eRunning, "Stopping container...");
		const CommandResult result = docker.StopContainer(options.ContainerName);
		if (!result.Succeeded())
			logger.WarningFormatted("Stop before re-auth exited with {}: {}", result.exit_code,
									Trim(result.stderr_text));
		AddStep(StepStatus::eDone, "Container stopped");
	}

	store.DeleteCredentials();
	pendingPKCE.reset();
	if (!GetSnapshot().GatewayToken)
		LoadGatewayEnvironment();
	AddStep(StepStatus::eDone, "Credentials removed");

	Mutate(
		[](LauncherSnapshot& s)
		{
			s.State = LauncherState::eNeedsAuth;
			s.MenuBar = MenuBarStatus::eStopped;
			s.ContainerStartTime.reset();
			s.UptimeTick = 0;
			s.GatewayHealthy = false;
			s.GatewayUptime.reset();
			s.AuthExpiredBanner.reset();
			s.AuthInput = AuthInputKind::eNone;
			s.AuthorizeURL.reset();
		});
}

//=================================
//===           AUTH            ===
//=================================
void LaunchOrchestrator::RunStartOAuth()
{
	PKCE pkce;
	try
	{
		pkce = OAuthClient::GeneratePKCE();
	}
	catch (const std::exception& e)
	{
		AddStep(StepStatus::eError, std::format("Failed to start OAuth: {}", e.what()));
		return;
	}
	const std::string url = OAuthClient::BuildAuthorizeURL(pkce);
	pendingPKCE = std::move(pkce);

	if (!options.SuppressSideEffects && !system.OpenURL(url))
		AddStep(StepStatus::eWarning, "Could not open the browser. Open the sign-in link manually.");

	Mutate(
		[&](LauncherSnapshot& s)
		{
			s.State = LauncherState::eWaitingForAuthInput;
			s.AuthInput = AuthInputKind::eOAuthCode;
			s.AuthorizeURL = url;
		});
	AddStep(StepStatus::eRunning, "Opened browser for Anthropic sign-in");
}

void LaunchOrchestrator::RunSubmitApiKey(const std::string& key)
{
	const std::string trimmed = Trim(key);
	if (trimmed.empty())
	{
		AddStep(StepStatus::eWarning, "Skipped API key. Set it up later in the Control UI.");
	}
	else
	{
		store.WriteApiKeyProfile(trimmed);
		AddStep(StepStatus::eDone, "API key saved");
	}

	Mutate(
		[](LauncherSnapshot& s)
		{
			s.State = LauncherState::eWorking;
			s.MenuBar = MenuBarStatus::eStarting;
			s.AuthInput = AuthInputKind::eNone;
			s.AuthorizeURL.reset();
		});
	ContinueAfterSetup();
}

void LaunchOrchestrator::RunSubmitOAuthCode(const std::string& input)
{
	if (!pendingPKCE)
	{
		AddStep(StepStatus::eError, "No PKCE session. Try signing in again.");
		SetState(LauncherState::eNeedsAuth, MenuBarStatus::eStarting);
		return;
	}

	const std::string code = NormalizeAuthorizationCode(input);
	if (code.empty())
	{
		AddStep(StepStatus::eWarning, "No authorization code entered");
		return;
	}

	logger.DebugFormatted("Exchanging code {}...", code.substr(0, 8));
	AddStep(StepStatus::eRunning, "Exchanging authorization code...");
	Mutate(
		[](LauncherSnapshot& s)
		{
			s.State = LauncherState::eWorking;
			s.AuthInput = AuthInputKind::eNone;
		});

	try
	{
		const OAuthCredentials creds = oauth.ExchangeCode(code, pendingPKCE->verifier);
		store.WriteOAuthCredentials(creds);
	}
	catch (const std::exception& e)
	{
		AddStep(StepStatus::eError, std::format("OAuth exchange failed: {}",
												Truncate(e.what(), LauncherError::DetailLimit)));
		Mutate(
			[](LauncherSnapshot& s)
			{
				s.State = LauncherState::eNeedsAuth;
				s.AuthorizeURL.reset();
			});
		return;
	}

	pendingPKCE.reset();
	Mutate([](LauncherSnapshot& s) { s.AuthorizeURL.reset(); });
	AddStep(StepStatus::eDone, "Signed in with Claude");
	ContinueAfterSetup();
}

void LaunchOrchestrator::RunSkipAuth()
{
	AddStep(StepStatus::eWarning, "Skipped auth. Set it up later in the Control UI.");
	Mutate(
		[](LauncherSnapshot& s)
		{
			s.State = LauncherState::eWorking;
			s.MenuBar = MenuBarStatus::eStarting;
			s.AuthInput = AuthInputKind::eNone;
			s.AuthorizeURL.reset();
		});
	ContinueAfterSetup();
}

//=================================
//===          MISC             ===
//=================================
std::string LaunchOrchestrator::BrowserURL() const
{
	const LauncherSnapshot current = GetSnapshot();
	std::string url = std::format("http://localhost:{}{}", current.Port, options.GatewayBasePath);
	if (current.GatewayToken)
		url += "?token=" + *current.GatewayToken;
	return url;
}

void LaunchOrchestrator::OpenBrowser()
{
	worker.Post([this] { RunOpenBrowser(); });
}

void LaunchOrchestrator::RunOpenBrowser()
{
	if (!options.SuppressSideEffects && !system.OpenURL(BrowserURL()))
	{
		AddStep(StepStatus::eWarning, "Could not open the browser");
		return;
	}
	AddStep(StepStatus::eDone, "Opened Control UI in browser");
}

std::string LaunchOrchestrator::FetchLogs(std::optional<uint32_t> tail)
{
	const CommandResult result =
		docker.Logs(options.ContainerName, tail.value_or(options.LogTailLines));
	if (result.stdout_text.empty())
		return result.stderr_text;
	if (result.stderr_text.empty())
		return result.stdout_text;
	return result.stdout_text + "\n--- stderr ---\n" + result.stderr_text;
}

//=================================
//===         HEALTH            ===
//=================================
void LaunchOrchestrator::StartSupervision()
{
	StopSupervision();
	const uint64_t generation = supervisionGeneration.load();
	consecutiveFailures = 0;
	if (!options.EnableTimers)
		return;

	const auto interval = std::max(
		options.MinimumHealthInterval,
		std::chrono::milliseconds(
			static_cast<int64_t>(options.Settings.healthCheckInterval * 1000.0)));
	healthTask = std::make_unique<PeriodicTask>(
		interval,
		[this, generation]
		{
			const HealthProbe probe = ProbeGateway();
			worker.Post([this, generation, probe] { ApplyHealthResult(generation, probe); });
		},
		true);
	uptimeTask = std::make_unique<PeriodicTask>(
		options.UptimeTickInterval,
		[this, generation]
		{
			worker.Post(
				[this, generation]
				{
					if (generation == supervisionGeneration.load())
						Mutate([](LauncherSnapshot& s) { ++s.UptimeTick; });
				});
		});
}

void LaunchOrchestrator::StopSupervision()
{
	++supervisionGeneration;
	healthTask.reset();
	uptimeTask.reset();
}

LaunchOrchestrator::HealthProbe LaunchOrchestrator::ProbeGateway() const
{
	HealthProbe probe;
	try
	{
		const HttpResponse status = http.Get(GatewayURL("/api/status"), options.HealthProbeTimeout);
		if (status.status == 200)
		{
			Json parsed = Json::parse(status.body, nullptr, false);
			if (!parsed.is_discarded() && parsed.is_object())
			{
				probe.Healthy = true;
				if (parsed.contains("uptime") && parsed["uptime"].is_number())
					probe.Uptime = static_cast<int64_t>(parsed["uptime"].get<double>());
				return probe;
			}
		}
	}
	catch (const std::exception& e)
	{
		logger.DebugFormatted("Status probe failed: {}", e.what());
	}

	try
	{
		probe.Healthy = http.Get(GatewayURL("/"), options.HealthProbeTimeout).Ok();
	}
	catch (const std::exception& e)
	{
		logger.DebugFormatted("Gateway probe failed: {}", e.what());
		probe.Healthy = false;
	}
	return probe;
}

void LaunchOrchestrator::ApplyHealthResult(uint64_t generation, const HealthProbe& probe)
{
	if (generation != supervisionGeneration.load() ||
		GetSnapshot().State != LauncherState::eRunning)
		return;

	if (probe.Healthy)
	{
		consecutiveFailures = 0;
		Mutate(
			[&](LauncherSnapshot& s)
			{
				s.GatewayHealthy = true;
				s.GatewayUptime = probe.Uptime;
			});
		return;
	}

	++consecutiveFailures;
	Mutate(
		[](LauncherSnapshot& s)
		{
			s.GatewayHealthy = false;
			s.GatewayUptime.reset();
		});
	logger.WarningFormatted("Gateway health check failed ({} in a row)", consecutiveFailures);
	if (consecutiveFailures < options.HealthFailureThreshold)
		return;

	if (docker.IsContainerRunning(options.ContainerName))
	{
		logger.Warning("Gateway unresponsive but the container is still running");
		return;
	}

	StopSupervision();
	AddStep(StepStatus::eError, "Container stopped unexpectedly");
	Mutate(
		[](LauncherSnapshot& s)
		{
			s.State = LauncherState::eError;
			s.MenuBar = MenuBarStatus::eStopped;
			s.ContainerStartTime.reset();
			s.LastError = LauncherErrorInfo{LauncherErrorType::eUnexpected,
											"Container stopped unexpectedly",
											RemediationAction::eNone};
		});
}

void LaunchOrchestrator::RunHealthCheckOnce()
{
	const uint64_t generation = supervisionGeneration.load();
	const HealthProbe probe = ProbeGateway();
	worker.Post([this, generation, probe] { ApplyHealthResult(generation, probe); });
	worker.WaitIdle();
}

//=================================
//===      STATE PLUMBING       ===
//=================================
LauncherSnapshot LaunchOrchestrator::GetSnapshot() const
{
	std::lock_guard lock(stateMutex);
	return snapshot;
}

LaunchOrchestrator::SubscriptionID LaunchOrchestrator::Subscribe(SnapshotCallback callback)
{
	std::lock_guard lock(subscriberMutex);
	const SubscriptionID id = nextSubscription++;
	subscribers.emplace(id, std::move(callback));
	return id;
}

void LaunchOrchestrator::Unsubscribe(SubscriptionID id)
{
	std::lock_guard lock(subscriberMutex);
	subscribers.erase(id);
}

void LaunchOrchestrator::Mutate(const std::function<void(LauncherSnapshot&)>& change)
{
	LauncherSnapshot published;
	{
		std::lock_guard lock(stateMutex);
		change(snapshot);
		published = snapshot;
	}

	std::vector<SnapshotCallback> callbacks;
	{
		std::lock_guard lock(subscriberMutex);
		callbacks.reserve(subscribers.size());
		for (const auto& [id, callback] : subscribers) callbacks.push_back(callback);
	}
	for (const auto& callback : callbacks)
	{
		try
		{
			callback(published);
		}
		catch (const std::exception& e)
		{
			logger.ErrorFormatted("Subscriber threw: {}", e.what());
		}
	}
}

void LaunchOrchestrator::AddStep(StepStatus status, const std::string& message)
{
	switch (status)
	{
	case StepStatus::eError:
		logger.Error(message);
		break;
	case StepStatus::eWarning:
		logger.Warning(message);
		break;
	default:
		logger.Debug(message);
		break;
	}
	Mutate([&](LauncherSnapshot& s) { s.Steps.Append(status, message); });
}

void LaunchOrchestrator::SetState(LauncherState state, MenuBarStatus menuBar)
{
	Mutate(
		[=](LauncherSnapshot& s)
		{
			s.State = state;
			s.MenuBar = menuBar;
		});
}

void LaunchOrchestrator::Fail(const LauncherError& error)
{
	StopSupervision();
	AddStep(StepStatus::eError, error.what());
	Mutate(
		[&](LauncherSnapshot& s)
		{
			s.State = LauncherState::eError;
			s.MenuBar = MenuBarStatus::eStopped;
			s.PullProgressText.reset();
			s.GatewayHealthy = false;
			s.LastError = LauncherErrorInfo{error.Type(), error.what(), error.Remediation()};
		});
}

void LaunchOrchestrator::MarkRunning()
{
	Mutate(
		[](LauncherSnapshot& s)
		{
			s.State = LauncherState::eRunning;
			s.MenuBar = MenuBarStatus::eRunning;
			s.ContainerStartTime = std::chrono::system_clock::now();
			s.UptimeTick = 0;
			s.GatewayHealthy = false;
			s.PullProgressText.reset();
			s.AuthInput = AuthInputKind::eNone;
			s.AuthorizeURL.reset();
		});
	StartSupervision();
}

void LaunchOrchestrator::LoadGatewayEnvironment()
{
	const auto env = store.ReadEnvironment();
	if (!env)
	{
		logger.WarningFormatted("No gateway environment at {}", store.Paths().EnvFile().string());
		return;
	}
	Mutate(
		[&](LauncherSnapshot& s)
		{
			if (!env->Token.empty())
				s.GatewayToken = env->Token;
			if (env->Port != 0)
				s.Port = env->Port;
		});
}

void LaunchOrchestrator::Sleep(std::chrono::milliseconds duration)
{
	if (!worker.SleepFor(duration))
		throw std::runtime_error("Launcher is shutting down");
}

std::string LaunchOrchestrator::GatewayURL(const std::string& path) const
{
	uint16_t port = 0;
	{
		std::lock_guard lock(stateMutex);
		port = snapshot.Port;
	}
	return std::format("http://127.0.0.1:{}{}{}", port, options.GatewayBasePath, path);
}

ContainerRunSpec LaunchOrchestrator::MakeRunSpec(uint16_t hostPort) const
{
	ContainerRunSpec run;
	run.Name = options.ContainerName;
	run.Image = options.Settings.dockerImage;
	run.HostPort = hostPort != 0 ? hostPort : options.Settings.port;
	run.ContainerPort = options.ContainerPort;
	run.ConfigDir = options.Paths.ConfigDir();
	run.WorkspaceDir = options.Paths.WorkspaceDir();
	run.EnvFile = options.Paths.EnvFile();
	run.Limits.Memory = options.Settings.memoryLimit;
	run.Limits.Cpus = options.Settings.cpuLimit;
	return run;
}

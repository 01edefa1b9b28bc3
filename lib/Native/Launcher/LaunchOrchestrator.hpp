#pragma once
#include <atomic>
#include <cstdint>
#include <chrono>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "Command/CommandRunner.hpp"
#include "Debug/Log.hpp"
#include "Docker/DockerCli.hpp"
#include "Global/Misc/PeriodicTask.hpp"
#include "Global/Misc/SerialWorker.hpp"
#include "Http/HttpClient.hpp"
#include "Launcher/LauncherError.hpp"
#include "Launcher/LauncherOptions.hpp"
#include "Launcher/LauncherSnapshot.hpp"
#include "OAuth/OAuthClient.hpp"
#include "State/StateStore.hpp"
#include "System/SystemActions.hpp"

/// @brief Brings the gateway container up, supervises it and tears it down.
///
/// Public operations return immediately. Lifecycle work runs on one serial
/// worker, which is also the only place lifecycle state is mutated. While an
/// operation is in flight every further lifecycle request is dropped, not
/// queued. Observers read snapshots; nothing is thrown past this class.
class LaunchOrchestrator
{
   public:
	using SubscriptionID = uint64_t;
	using SnapshotCallback = std::function<void(const LauncherSnapshot&)>;

	struct HealthProbe
	{
		bool Healthy = false;
		std::optional<int64_t> Uptime;
	};

	LaunchOrchestrator(LauncherOptions _options, ICommandRunner& _runner, IHttpClient& _http,
					   ISystemActions& _system);
	~LaunchOrchestrator();

	LaunchOrchestrator(const LaunchOrchestrator&) = delete;
	LaunchOrchestrator& operator=(const LaunchOrchestrator&) = delete;

	//=================================
	//===        LIFECYCLE          ===
	//=================================
	void Start();
	void StopContainer();
	void RestartContainer();
	/// @brief Remove the container and the whole state directory, secret included.
	void ResetEverything();
	/// @brief Drop stored credentials only and return to the auth choice.
	void ReAuthenticate();

	//=================================
	//===           AUTH            ===
	//=================================
	void StartOAuth();
	void ShowApiKeyInput();
	/// @brief An empty or whitespace key skips auth with a warning.
	void SubmitApiKey(const std::string& key);
	void SubmitOAuthCode(const std::string& input);
	void SkipAuth();

	//=================================
	//===          MISC             ===
	//=================================
	/// @brief Open the Control UI. Queued behind any running operation.
	void OpenBrowser();
	std::string BrowserURL() const;
	/// @brief Tail of the container log. Runs on the calling thread.
	std::string FetchLogs(std::optional<uint32_t> tail = std::nullopt);

	/// @brief Probe once on the calling thread and apply the result, as a timer tick would.
	void RunHealthCheckOnce();
	/// @brief Block until every posted operation has finished.
	void WaitForIdle();
	bool IsOperationInFlight() const { return operationInFlight.load(); }

	LauncherSnapshot GetSnapshot() const;
	SubscriptionID Subscribe(SnapshotCallback callback);
	void Unsubscribe(SubscriptionID id);

	const LauncherOptions& Options() const { return options; }

   private:
	LauncherOptions options;
	IHttpClient& http;
	ISystemActions& system;
	DockerCli docker;
	StateStore store;
	OAuthClient oauth;
	Log logger = Log("Launcher");

	mutable std::mutex stateMutex;
	LauncherSnapshot snapshot;

	std::mutex subscriberMutex;
	std::map<SubscriptionID, SnapshotCallback> subscribers;
	SubscriptionID nextSubscription = 1;

	std::atomic_bool operationInFlight = false;

	// Owned by the worker thread.
	bool isFirstRun = false;
	std::optional<PKCE> pendingPKCE;
	int consecutiveFailures = 0;
	std::atomic<uint64_t> supervisionGeneration = 0;
	std::unique_ptr<PeriodicTask> healthTask;
	std::unique_ptr<PeriodicTask> uptimeTask;

	SerialWorker worker;

	bool TryBeginOperation(std::initializer_list<LauncherState> allowed);
	/// @brief Run body on the worker, then release the in-flight guard.
	void PostOperation(std::string name, std::function<void()> body);

	void RunStart();
	bool TryRecoverRunningContainer();
	void CheckEngine();
	void FirstRunSetup();
	void RefreshOAuthIfNeeded();
	void ContinueAfterSetup();
	void EnsureImage();
	void RunContainer();
	void WaitForGateway();

	void RunStop();
	void RunRestart();
	void RunReset();
	void RunReAuthenticate();
	void RunStartOAuth();
	void RunSubmitApiKey(const std::string& key);
	void RunSubmitOAuthCode(const std::string& input);
	void RunSkipAuth();
	void RunOpenBrowser();

	void Mutate(const std::function<void(LauncherSnapshot&)>& change);
	void AddStep(StepStatus status, const std::string& message);
	void SetState(LauncherState state, MenuBarStatus menuBar);
	void Fail(const LauncherError& error);
	void MarkRunning();
	void LoadGatewayEnvironment();

	void StartSupervision();
	void StopSupervision();
	HealthProbe ProbeGateway() const;
	void ApplyHealthResult(uint64_t generation, const HealthProbe& probe);

	void Sleep(std::chrono::milliseconds duration);
	std::string GatewayURL(const std::string& path) const;
	ContainerRunSpec MakeRunSpec(uint16_t hostPort) const;
};

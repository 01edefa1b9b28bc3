#include <gtest/gtest.h>

#include <chrono>

#include "System/SystemActions.hpp"
#include "TestDoubles.hpp"

#ifndef __APPLE__
TEST(SystemActions, OpenURLDetachesTheBrowser)
{
	FakeCommandRunner runner;
	runner.On({"-c"}, 0);
	DesktopSystemActions actions(runner);

	EXPECT_TRUE(actions.OpenURL("http://localhost:18789/openclaw?token=abc"));
	const auto calls = runner.Calls();
	ASSERT_EQ(calls.size(), 1u);
	const std::vector<std::string> expected = {"sh", "-c", "xdg-open \"$0\" >/dev/null 2>&1 &",
											   "http://localhost:18789/openclaw?token=abc"};
	EXPECT_EQ(calls[0], expected);
}

TEST(SystemActions, OpenURLReportsLaunchFailure)
{
	FakeCommandRunner runner;
	runner.On({"-c"}, 127, "", "sh: not found");
	DesktopSystemActions actions(runner);
	EXPECT_FALSE(actions.OpenURL("http://localhost:18789/openclaw"));
}

TEST(SystemActions, OpenURLReturnsWhileTheBrowserKeepsRunning)
{
	TempDir dir;
	const auto fakeOpener = dir / "xdg-open";
	// Stands in for a browser that stays open long after the launch.
	WriteTextFile(fakeOpener, "#!/bin/sh\nexec sleep 5\n");
	std::filesystem::permissions(fakeOpener, std::filesystem::perms::owner_all,
								 std::filesystem::perm_options::replace);

	CommandEnvironment env;
	env.ExtraSearchDirs = {dir.Path().string()};
	ProcessCommandRunner runner(env);
	DesktopSystemActions actions(runner);

	const auto started = std::chrono::steady_clock::now();
	EXPECT_TRUE(actions.OpenURL("http://localhost:18789/openclaw"));
	EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
}
#endif

#include <fcntl.h>
#include <gtest/gtest.h>

#include <chrono>

#include "Command/CommandRunner.hpp"
#include "Global/Misc/String_utils.hpp"
#include "TestDoubles.hpp"

namespace fs = std::filesystem;

TEST(CommandRunner, CapturesOutputAndExitCode)
{
	ProcessCommandRunner runner;
	const CommandResult r = runner.Execute({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"});
	EXPECT_EQ(r.exit_code, 3);
	EXPECT_FALSE(r.Succeeded());
	EXPECT_EQ(r.stdout_text, "out\n");
	EXPECT_EQ(r.stderr_text, "err\n");
}

TEST(CommandRunner, SuccessIsExitZero)
{
	ProcessCommandRunner runner;
	EXPECT_TRUE(runner.Execute({"/bin/sh", "-c", "true"}).Succeeded());
}

TEST(CommandRunner, LargeOutputOnBothStreamsDoesNotDeadlock)
{
	ProcessCommandRunner runner;
	// Well past a pipe buffer on each stream.
	const CommandResult r = runner.Execute(
		{"/bin/sh", "-c",
		 "i=0; while [ $i -lt 20000 ]; do echo 0123456789abcdef; echo fedcba9876543210 1>&2; "
		 "i=$((i+1)); done"});
	EXPECT_EQ(r.exit_code, 0);
	EXPECT_EQ(r.stdout_text.size(), 20000u * 17u);
	EXPECT_EQ(r.stderr_text.size(), 20000u * 17u);
}

TEST(CommandRunner, StreamingReportsLines)
{
	ProcessCommandRunner runner;
	std::vector<std::string> lines;
	const CommandResult r = runner.ExecuteStreaming(
		{"/bin/sh", "-c", "echo 'Pulling fs layer'; echo 'Downloading'; printf 'Complete'"},
		[&](std::string_view line) { lines.emplace_back(line); });
	EXPECT_EQ(r.exit_code, 0);
	const std::vector<std::string> expected = {"Pulling fs layer", "Downloading", "Complete"};
	EXPECT_EQ(lines, expected);
	EXPECT_EQ(r.stdout_text, "Pulling fs layer\nDownloading\nComplete");
}

TEST(CommandRunner, ExtraSearchDirsComeFirst)
{
	TempDir dir;
	const fs::path tool = dir / "openclaw-fake-engine";
	WriteTextFile(tool, "#!/bin/sh\necho found-in-extra-dir\n");
	fs::permissions(tool, fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read,
					fs::perm_options::replace);

	CommandEnvironment env;
	env.ExtraSearchDirs = {dir.Path().string()};
	ProcessCommandRunner runner(env);

	const CommandResult r = runner.Execute({"openclaw-fake-engine"});
	EXPECT_EQ(r.exit_code, 0);
	EXPECT_EQ(r.stdout_text, "found-in-extra-dir\n");

	const CommandResult path = runner.Execute({"/bin/sh", "-c", "printf %s \"$PATH\""});
	EXPECT_TRUE(StartsWith(path.stdout_text, dir.Path().string() + ":"));
}

TEST(CommandRunner, OverridesReachTheChild)
{
	CommandEnvironment env;
	env.Overrides["DOCKER_CONFIG"] = "/tmp/openclaw-docker-config";
	ProcessCommandRunner runner(env);
	const CommandResult r = runner.Execute({"/bin/sh", "-c", "printf %s \"$DOCKER_CONFIG\""});
	EXPECT_EQ(r.stdout_text, "/tmp/openclaw-docker-config");
}

TEST(CommandRunner, BuildSearchPathOrder)
{
	CommandEnvironment env;
	env.ExtraSearchDirs = {"/opt/a", "/opt/b"};
	EXPECT_EQ(env.BuildSearchPath("/usr/bin:/bin"), "/opt/a:/opt/b:/usr/bin:/bin");
}

TEST(CommandRunner, MissingProgramReportsSpawnFailure)
{
	ProcessCommandRunner runner;
	const CommandResult r = runner.Execute({"openclaw-definitely-not-installed"});
	EXPECT_EQ(r.exit_code, 127);
	EXPECT_FALSE(r.stderr_text.empty());

	EXPECT_EQ(runner.Execute({}).exit_code, 127);
}

TEST(CommandRunner, DetachedChildDoesNotHoldTheCall)
{
	ProcessCommandRunner runner;
	const auto started = std::chrono::steady_clock::now();
	const CommandResult r = runner.Execute({"/bin/sh", "-c", "sleep 5 >/dev/null 2>&1 &"});
	const auto elapsed = std::chrono::steady_clock::now() - started;
	EXPECT_EQ(r.exit_code, 0);
	EXPECT_LT(elapsed, std::chrono::seconds(3));
}

#ifdef __linux__
TEST(CommandRunner, ChildInheritsOnlyStandardStreams)
{
	// Descriptors the test process itself leaks into children.
	size_t inheritable = 0;
	for (const auto& entry : fs::directory_iterator("/proc/self/fd"))
	{
		const int fd = std::stoi(entry.path().filename().string());
		if (fd <= STDERR_FILENO)
			continue;
		const int flags = fcntl(fd, F_GETFD);
		if (flags >= 0 && !(flags & FD_CLOEXEC))
			++inheritable;
	}

	ProcessCommandRunner runner;
	const CommandResult r = runner.Execute({"/bin/ls", "/proc/self/fd"});
	ASSERT_EQ(r.exit_code, 0);
	const auto listed = SplitLines(r.stdout_text);
	// stdin, stdout, stderr and the directory ls is reading.
	EXPECT_LE(listed.size(), inheritable + 4);
}
#endif

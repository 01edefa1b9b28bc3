#include "CommandRunner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "Global/Misc/String_utils.hpp"

extern char** environ;

namespace
{
constexpr std::string_view kDefaultPath = "/usr/bin:/bin:/usr/sbin:/sbin";
constexpr int kSpawnFailedExitCode = 127;

void set_nonblocking(int fd)
{
	int fl = fcntl(fd, F_GETFL, 0);
	if (fl < 0)
		return;
	(void)fcntl(fd, F_SETFL, fl | O_NONBLOCK);
}

void close_pipe(int (&p)[2])
{
	if (p[0] >= 0)
		close(p[0]);
	if (p[1] >= 0)
		close(p[1]);
	p[0] = p[1] = -1;
}

CommandResult SpawnFailure(const std::string& what)
{
	CommandResult r;
	r.exit_code = kSpawnFailedExitCode;
	r.stderr_text = what + ": " + std::strerror(errno);
	return r;
}

// Splits streamed chunks into lines; the tail is flushed when the stream closes.
struct LineSplitter
{
	std::string pending;

	void Feed(std::string_view chunk, const ICommandRunner::LineCallback& onLine)
	{
		pending.append(chunk);
		size_t pos;
		while ((pos = pending.find('\n')) != std::string::npos)
		{
			onLine(std::string_view(pending).substr(0, pos));
			pending.erase(0, pos + 1);
		}
	}
	void Flush(const ICommandRunner::LineCallback& onLine)
	{
		if (!pending.empty())
			onLine(pending);
		pending.clear();
	}
};
}  // namespace

std::string CommandEnvironment::BuildSearchPath(std::string_view currentPath) const
{
	std::vector<std::string> parts = ExtraSearchDirs;
	parts.emplace_back(currentPath.empty() ? kDefaultPath : currentPath);
	return JoinStrings(parts, ":");
}

CommandResult ICommandRunner::ExecuteStreaming(const std::vector<std::string>& argv,
											   const LineCallback& onLine)
{
	CommandResult r = Execute(argv);
	for (const auto& line : SplitLines(r.stdout_text)) onLine(line);
	for (const auto& line : SplitLines(r.stderr_text)) onLine(line);
	return r;
}

CommandResult ProcessCommandRunner::Execute(const std::vector<std::string>& argv)
{
	return RunCapture(argv, nullptr);
}

CommandResult ProcessCommandRunner::ExecuteStreaming(const std::vector<std::string>& argv,
													 const LineCallback& onLine)
{
	return RunCapture(argv, &onLine);
}

std::vector<std::string> ProcessCommandRunner::BuildChildEnvironment(
	std::string& outSearchPath) const
{
	const char* inheritedPath = std::getenv("PATH");
	outSearchPath = environment.BuildSearchPath(inheritedPath ? inheritedPath : "");

	std::map<std::string, std::string> vars;
	for (char** e = environ; e && *e; ++e)
	{
		std::string_view kv(*e);
		const size_t eq = kv.find('=');
		if (eq == std::string_view::npos)
			continue;
		vars[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
	}
	for (const auto& [key, value] : environment.Overrides) vars[key] = value;
	vars["PATH"] = outSearchPath;

	std::vector<std::string> out;
	out.reserve(vars.size());
	for (const auto& [key, value] : vars) out.push_back(key + "=" + value);
	return out;
}

std::string ProcessCommandRunner::ResolveExecutable(const std::string& program,
													const std::string& searchPath) const
{
	if (program.find('/') != std::string::npos)
		return program;

	size_t pos = 0;
	while (pos <= searchPath.size())
	{
		const size_t next = searchPath.find(':', pos);
		std::string dir = searchPath.substr(pos, next == std::string::npos ? std::string::npos
																			: next - pos);
		if (!dir.empty())
		{
			std::string candidate = dir + "/" + program;
			if (::access(candidate.c_str(), X_OK) == 0)
				return candidate;
		}
		if (next == std::string::npos)
			break;
		pos = next + 1;
	}
	return program;
}

CommandResult ProcessCommandRunner::RunCapture(const std::vector<std::string>& argv,
											   const LineCallback* onLine)
{
	if (argv.empty())
	{
		CommandResult r;
		r.exit_code = kSpawnFailedExitCode;
		r.stderr_text = "empty command";
		return r;
	}

	// Everything the child needs is prepared before fork; only async-signal-safe
	// calls happen between fork and exec.
	std::string searchPath;
	const std::vector<std::string> envStrings = BuildChildEnvironment(searchPath);
	const std::string executable = ResolveExecutable(argv[0], searchPath);

	std::vector<char*> cargv;
	cargv.reserve(argv.size() + 1);
	for (auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
	cargv.push_back(nullptr);

	std::vector<char*> cenv;
	cenv.reserve(envStrings.size() + 1);
	for (auto& s : envStrings) cenv.push_back(const_cast<char*>(s.c_str()));
	cenv.push_back(nullptr);

	int out_pipe[2]{-1, -1};
	int err_pipe[2]{-1, -1};
	if (pipe2(out_pipe, O_CLOEXEC) != 0)
		return SpawnFailure("pipe(stdout) failed");
	if (pipe2(err_pipe, O_CLOEXEC) != 0)
	{
		CommandResult r = SpawnFailure("pipe(stderr) failed");
		close_pipe(out_pipe);
		return r;
	}

	pid_t pid = fork();
	if (pid < 0)
	{
		CommandResult r = SpawnFailure("fork failed");
		close_pipe(out_pipe);
		close_pipe(err_pipe);
		return r;
	}

	if (pid == 0)
	{
		// child
		int devnull = open("/dev/null", O_RDONLY);
		if (devnull >= 0)
		{
			dup2(devnull, STDIN_FILENO);
			if (devnull != STDIN_FILENO)
				close(devnull);
		}
		dup2(out_pipe[1], STDOUT_FILENO);
		dup2(err_pipe[1], STDERR_FILENO);
		close(out_pipe[0]);
		close(out_pipe[1]);
		close(err_pipe[0]);
		close(err_pipe[1]);

		execve(executable.c_str(), cargv.data(), cenv.data());
		const char msg[] = "exec failed\n";
		(void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
		_exit(kSpawnFailedExitCode);
	}

	// parent
	close(out_pipe[1]);
	close(err_pipe[1]);

	set_nonblocking(out_pipe[0]);
	set_nonblocking(err_pipe[0]);

	CommandResult r;
	bool out_open = true;
	bool err_open = true;
	LineSplitter outLines;
	LineSplitter errLines;

	char buf[4096];

	// Both streams are drained in one poll loop so neither pipe can fill up and
	// block the child while we wait on the other.
	while (out_open || err_open)
	{
		pollfd fds[2];
		int nfds = 0;
		int idx_out = -1, idx_err = -1;

		if (out_open)
		{
			idx_out = nfds;
			fds[nfds++] = pollfd{out_pipe[0], short(POLLIN | POLLHUP | POLLERR), 0};
		}
		if (err_open)
		{
			idx_err = nfds;
			fds[nfds++] = pollfd{err_pipe[0], short(POLLIN | POLLHUP | POLLERR), 0};
		}

		int pr = poll(fds, nfds, -1);
		if (pr < 0)
		{
			if (errno == EINTR)
				continue;
			break;
		}

		auto drain_fd = [&](int fd, std::string& sink, bool& open_flag, LineSplitter& lines)
		{
			for (;;)
			{
				ssize_t n = read(fd, buf, sizeof(buf));
				if (n > 0)
				{
					sink.append(buf, buf + n);
					if (onLine)
						lines.Feed(std::string_view(buf, static_cast<size_t>(n)), *onLine);
					continue;
				}
				if (n == 0)
				{
					close(fd);
					open_flag = false;
					if (onLine)
						lines.Flush(*onLine);
					return;
				}
				if (errno == EINTR)
					continue;
				if (errno == EAGAIN || errno == EWOULDBLOCK)
					return;
				close(fd);
				open_flag = false;
				return;
			}
		};

		if (idx_out != -1 && (fds[idx_out].revents & (POLLIN | POLLHUP | POLLERR)))
		{
			drain_fd(out_pipe[0], r.stdout_text, out_open, outLines);
		}
		if (idx_err != -1 && (fds[idx_err].revents & (POLLIN | POLLHUP | POLLERR)))
		{
			drain_fd(err_pipe[0], r.stderr_text, err_open, errLines);
		}
	}
	if (out_open)
		close(out_pipe[0]);
	if (err_open)
		close(err_pipe[0]);

	int status = 0;
	while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
	{
	}
	if (WIFEXITED(status))
		r.exit_code = WEXITSTATUS(status);
	else if (WIFSIGNALED(status))
		r.exit_code = 128 + WTERMSIG(status);
	else
		r.exit_code = -1;

	return r;
}

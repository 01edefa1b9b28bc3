#include "CrashHandler.hpp"

#include <boost/stacktrace/stacktrace.hpp>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <vector>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#endif
#include <unistd.h>

void CrashHandler::Init(const std::string& name)
{
	programName = name;
	try
	{
		programPath = GetExecutablePath();
	}
	catch (const std::runtime_error& e)
	{
		std::cerr << programName << ": " << e.what() << "\n";
	}

	struct sigaction action;
	std::memset(&action, 0, sizeof(action));
	action.sa_handler = &CrashHandler::OnSignal;
	sigemptyset(&action.sa_mask);
	// One shot: a second fault inside the handler takes the default action.
	action.sa_flags = SA_RESETHAND;
	for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGILL, SIGBUS}) ::sigaction(sig, &action, nullptr);
}

void CrashHandler::OnSignal(int sig)
{
	Get().HandleSignal(sig);
}

void CrashHandler::HandleSignal(int sig)
{
	std::cerr << "\n\n*** " << programName << " crashed (signal " << sig << ": "
			  << strsignal(sig) << ") ***\n";
	if (!programPath.empty())
		std::cerr << "Executable: " << programPath.string() << "\n";
	std::cerr << boost::stacktrace::stacktrace();
	std::cerr.flush();

	_exit(128 + sig);
}

std::filesystem::path CrashHandler::GetExecutablePath()
{
#if defined(__APPLE__)
	uint32_t size = 0;
	_NSGetExecutablePath(nullptr, &size);
	std::vector<char> buf(size);
	if (_NSGetExecutablePath(buf.data(), &size) != 0)
		throw std::runtime_error("_NSGetExecutablePath failed");
	return std::filesystem::weakly_canonical(std::filesystem::path(buf.data()));
#elif defined(__linux__)
	std::vector<char> buf(1024);
	for (;;)
	{
		const ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size());
		if (n < 0)
			throw std::runtime_error("readlink(/proc/self/exe) failed");
		if (static_cast<size_t>(n) < buf.size())
			return std::filesystem::path(std::string(buf.data(), static_cast<size_t>(n)));
		buf.resize(buf.size() * 2);
	}
#else
#error "GetExecutablePath not implemented for this platform"
#endif
}

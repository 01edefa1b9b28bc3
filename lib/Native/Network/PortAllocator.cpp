#include "PortAllocator.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <random>

#include "Debug/Log.hpp"

namespace
{
// Binds 127.0.0.1:port and returns the bound port, or 0 on failure.
uint16_t TryBindLoopback(uint16_t port)
{
	int sock = socket(AF_INET, SOCK_STREAM, 0);
	if (sock < 0)
		return 0;
	sockaddr_in addr{};
	addr.sin_family = AF_INET;
	addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	addr.sin_port = htons(port);
	uint16_t bound = 0;
	if (bind(sock, (sockaddr*)&addr, sizeof(addr)) == 0)
	{
		socklen_t len = sizeof(addr);
		if (getsockname(sock, (sockaddr*)&addr, &len) == 0)
			bound = ntohs(addr.sin_port);
	}
	close(sock);
	return bound;
}
}  // namespace

bool PortAllocator::IsPortInUse(uint16_t port)
{
	return TryBindLoopback(port) == 0;
}

std::optional<uint16_t> PortAllocator::PickRandomFreePort()
{
	static std::random_device rd;
	std::mt19937 gen(rd());
	std::uniform_int_distribution<int> dist(RandomRangeBegin, RandomRangeEnd);

	for (int i = 0; i < RandomAttempts; ++i)
	{
		const auto candidate = static_cast<uint16_t>(dist(gen));
		if (TryBindLoopback(candidate) == candidate)
			return candidate;
	}
	if (const uint16_t kernelPick = TryBindLoopback(0); kernelPick != 0)
		return kernelPick;
	return std::nullopt;
}

uint16_t PortAllocator::Choose(uint16_t defaultPort, bool randomize)
{
	if (!randomize)
		return defaultPort;
	if (auto port = PickRandomFreePort())
		return *port;
	Log("PortAllocator").WarningFormatted("No free random port found, using {}", defaultPort);
	return defaultPort;
}

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "Network/PortAllocator.hpp"

namespace
{
// Holds a loopback listener on a kernel-chosen port for the lifetime of the object.
class HeldPort
{
	int sock = -1;
	uint16_t port = 0;

   public:
	HeldPort()
	{
		sock = socket(AF_INET, SOCK_STREAM, 0);
		sockaddr_in addr{};
		addr.sin_family = AF_INET;
		addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
		addr.sin_port = 0;
		if (sock >= 0 && bind(sock, (sockaddr*)&addr, sizeof(addr)) == 0 && listen(sock, 1) == 0)
		{
			socklen_t len = sizeof(addr);
			getsockname(sock, (sockaddr*)&addr, &len);
			port = ntohs(addr.sin_port);
		}
	}
	~HeldPort()
	{
		if (sock >= 0)
			close(sock);
	}
	uint16_t Port() const { return port; }
};
}  // namespace

TEST(PortAllocator, DefaultPortWhenNotRandomized)
{
	EXPECT_EQ(PortAllocator::Choose(18789, false), 18789);
}

TEST(PortAllocator, RandomPortIsInRangeAndFree)
{
	const uint16_t port = PortAllocator::Choose(18789, true);
	EXPECT_NE(port, 0);
	if (port != 18789)
	{
		EXPECT_FALSE(PortAllocator::IsPortInUse(port));
	}
	const auto picked = PortAllocator::PickRandomFreePort();
	ASSERT_TRUE(picked.has_value());
	EXPECT_GT(*picked, 0);
}

TEST(PortAllocator, DetectsPortInUse)
{
	HeldPort held;
	ASSERT_NE(held.Port(), 0);
	EXPECT_TRUE(PortAllocator::IsPortInUse(held.Port()));
}

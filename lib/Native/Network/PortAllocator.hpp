#pragma once
#include <cstdint>
#include <optional>

/// @brief Host port selection for the gateway's loopback publish.
class PortAllocator
{
   public:
	static constexpr uint16_t RandomRangeBegin = 20000;
	static constexpr uint16_t RandomRangeEnd = 60999;
	static constexpr int RandomAttempts = 64;

	/// @brief True when 127.0.0.1:port cannot be bound right now.
	static bool IsPortInUse(uint16_t port);
	/// @brief A free loopback port picked at random from the range above,
	/// or kernel-assigned if every attempt collided.
	static std::optional<uint16_t> PickRandomFreePort();
	/// @brief defaultPort unless randomize is set and a free port was found.
	static uint16_t Choose(uint16_t defaultPort, bool randomize);
};

#include "LauncherSnapshot.hpp"

#include <format>

std::string LauncherSnapshot::UptimeString(std::chrono::system_clock::time_point now) const
{
	if (!ContainerStartTime || now <= *ContainerStartTime)
		return "00:00:00";
	const auto total =
		std::chrono::duration_cast<std::chrono::seconds>(now - *ContainerStartTime).count();
	return std::format("{:02}:{:02}:{:02}", total / 3600, (total % 3600) / 60, total % 60);
}

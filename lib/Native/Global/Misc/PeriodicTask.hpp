#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

/// @brief Runs a callback on its own thread every interval until destroyed.
/// Destruction cancels the wait immediately and joins, so it must not happen
/// from inside the callback.
class PeriodicTask
{
	std::jthread thread;

   public:
	PeriodicTask(std::chrono::milliseconds interval, std::function<void()> tick,
				 bool fireImmediately = false)
		: thread(
			  [interval, fireImmediately, tick = std::move(tick)](std::stop_token st)
			  {
				  if (fireImmediately)
					  tick();
				  std::mutex m;
				  std::condition_variable_any cv;
				  while (!st.stop_requested())
				  {
					  {
						  std::unique_lock lock(m);
						  cv.wait_for(lock, st, interval, [] { return false; });
					  }
					  if (st.stop_requested())
						  break;
					  tick();
				  }
			  })
	{
	}

	PeriodicTask(const PeriodicTask&) = delete;
	PeriodicTask& operator=(const PeriodicTask&) = delete;
};

#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

#include "Debug/Log.hpp"

/// @brief One background thread running posted tasks strictly in order.
/// The owner of some state posts every mutation here so that mutations never
/// interleave.
class SerialWorker
{
	Log logger = Log("SerialWorker");
	std::mutex mutex;
	std::condition_variable_any queueCv;
	std::condition_variable_any idleCv;
	std::deque<std::function<void()>> tasks;
	bool busy = false;
	bool stopped = false;

	std::mutex sleepMutex;
	std::condition_variable_any sleepCv;

	std::jthread thread;

   public:
	SerialWorker()
		: thread([this](std::stop_token st) { Loop(st); })
	{
	}
	~SerialWorker() { Shutdown(); }

	SerialWorker(const SerialWorker&) = delete;
	SerialWorker& operator=(const SerialWorker&) = delete;

	void Post(std::function<void()> task)
	{
		{
			std::lock_guard lock(mutex);
			tasks.push_back(std::move(task));
		}
		queueCv.notify_one();
	}

	/// @brief Block until the queue is drained and no task is executing.
	/// A no-op when called from the worker itself.
	void WaitIdle()
	{
		if (IsWorkerThread())
			return;
		std::unique_lock lock(mutex);
		idleCv.wait(lock, [this] { return (tasks.empty() && !busy) || stopped; });
	}

	/// @brief Sleep on the worker, waking early on shutdown.
	/// @return false when the worker is shutting down.
	bool SleepFor(std::chrono::milliseconds duration)
	{
		std::stop_token st = thread.get_stop_token();
		std::unique_lock lock(sleepMutex);
		sleepCv.wait_for(lock, st, duration, [] { return false; });
		return !st.stop_requested();
	}

	bool IsWorkerThread() const { return std::this_thread::get_id() == thread.get_id(); }

	/// @brief Stop after the running task. Queued tasks are dropped.
	void Shutdown()
	{
		if (!thread.joinable() || IsWorkerThread())
			return;
		thread.request_stop();
		thread.join();
		std::lock_guard lock(mutex);
		tasks.clear();
		idleCv.notify_all();
	}

   private:
	void Loop(std::stop_token st)
	{
		while (true)
		{
			std::function<void()> task;
			{
				std::unique_lock lock(mutex);
				queueCv.wait(lock, st, [this] { return !tasks.empty(); });
				if (st.stop_requested())
					break;
				task = std::move(tasks.front());
				tasks.pop_front();
				busy = true;
			}
			try
			{
				task();
			}
			catch (const std::exception& e)
			{
				logger.ErrorFormatted("Task failed: {}", e.what());
			}
			{
				std::lock_guard lock(mutex);
				busy = false;
			}
			idleCv.notify_all();
		}
		std::lock_guard lock(mutex);
		busy = false;
		stopped = true;
		idleCv.notify_all();
	}
};

#pragma once

#include <stddef.h>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace zfs_undelete
{

	inline size_t default_thread_count()
	{
		unsigned n = std::thread::hardware_concurrency();
		return n == 0 ? 1 : n;
	}

	// Runs task(0) ... task(count-1) on 'thread_count' threads pulling indexes from a shared counter.
	// The first exception stops the remaining work and is rethrown once all threads joined.
	inline void parallel_for(size_t count, size_t thread_count, const std::function<void(size_t)>& task)
	{
		if (count == 0)
			return;
		if (thread_count == 0)
			thread_count = default_thread_count();
		if (thread_count > count)
			thread_count = count;

		std::atomic<size_t> next_idx(0);
		std::atomic<bool> failed(false);
		std::exception_ptr first_error;
		std::mutex error_mutex;

		auto worker = [&]()
			{
				while (!failed)
				{
					size_t idx = next_idx++;
					if (idx >= count)
						return;
					try
					{
						task(idx);
					}
					catch (...)
					{
						std::lock_guard<std::mutex> lock(error_mutex);
						if (!first_error)
							first_error = std::current_exception();
						failed = true;
					}
				}
			};

		if (thread_count == 1)
			worker();
		else
		{
			std::vector<std::thread> threads;
			for (size_t i = 0; i != thread_count; ++i)
				threads.emplace_back(worker);
			for (std::thread& t : threads)
				t.join();
		}
		if (first_error)
			std::rethrow_exception(first_error);
	}

} // namespace zfs_undelete

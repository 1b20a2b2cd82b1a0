#include "parallel.h"

#include "errors.h"

#include <algorithm>
#include <exception>
#include <mutex>
#include <omp.h>

void parallelForChunks(std::size_t count, const ParallelOptions& options,
	const std::function<void(std::size_t begin, std::size_t end)>& body) {
	if (count == 0) {
		return;
	}
	std::size_t chunk = options.chunkSize > 0 ? static_cast<std::size_t>(options.chunkSize) : 64;
	long long chunkCount = static_cast<long long>((count + chunk - 1) / chunk);
	int threads = options.numThreads > 0 ? options.numThreads : omp_get_max_threads();

	std::atomic<bool> stop{ false };
	bool cancelled = false;
	std::exception_ptr failure;
	std::mutex failureMutex;

	#pragma omp parallel for schedule(dynamic, 1) num_threads(threads)
	for (long long c = 0; c < chunkCount; c++) {
		if (stop.load(std::memory_order_relaxed)) {
			continue;
		}
		if (options.cancel != nullptr && options.cancel->load(std::memory_order_relaxed)) {
			std::lock_guard<std::mutex> lock(failureMutex);
			cancelled = true;
			stop.store(true, std::memory_order_relaxed);
			continue;
		}
		std::size_t begin = static_cast<std::size_t>(c) * chunk;
		std::size_t end = std::min(count, begin + chunk);
		try {
			body(begin, end);
		}
		catch (...) {
			// exceptions must not leave the OpenMP region, rethrown below
			std::lock_guard<std::mutex> lock(failureMutex);
			if (!failure) {
				failure = std::current_exception();
			}
			stop.store(true, std::memory_order_relaxed);
		}
	}

	if (failure) {
		std::rethrow_exception(failure);
	}
	if (cancelled) {
		throw CancelledError("parallel map cancelled");
	}
}

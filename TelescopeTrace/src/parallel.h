#pragma once

#include <atomic>
#include <cstddef>
#include <functional>

struct ParallelOptions {
	int numThreads = 0;      // 0 lets OpenMP decide
	int chunkSize = 64;      // grid cells per work item
	const std::atomic<bool>* cancel = nullptr; // polled once per chunk, owned by the caller
};

// Runs body(begin, end) over [0, count) in chunks on an OpenMP team.
// Throws CancelledError after the parallel region if the cancel flag was seen set;
// an exception thrown by body is rethrown on the calling thread.
void parallelForChunks(std::size_t count, const ParallelOptions& options,
	const std::function<void(std::size_t begin, std::size_t end)>& body);

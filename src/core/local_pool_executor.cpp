#include "batch_executor.hpp"
#include "duckdb/common/exception.hpp"
#include <system_error>

namespace duckdb {
namespace regex_log {

LocalPoolExecutor::LocalPoolExecutor(const CompiledPattern &pattern_p, idx_t column_count_p, idx_t thread_count,
                                     idx_t max_line_length_p)
    : pattern(pattern_p), column_count(column_count_p), max_line_length(max_line_length_p) {
	if (thread_count == 0) {
		throw InternalException("LocalPoolExecutor requires at least one thread");
	}
	workers.reserve(thread_count);
	try {
		for (idx_t i = 0; i < thread_count; i++) {
			workers.emplace_back(&LocalPoolExecutor::WorkerLoop, this);
		}
	} catch (const std::system_error &e) {
		// Threads already started must be joined before the vector is destroyed
		Shutdown();
		throw IOException("Failed to start regex_log worker thread: %s", e.what());
	}
}

LocalPoolExecutor::~LocalPoolExecutor() {
	Shutdown();
}

void LocalPoolExecutor::Shutdown() {
	{
		std::lock_guard<std::mutex> guard(lock);
		shutdown = true;
		queue.clear();
	}
	token.CancelAfter(0);
	work_available.notify_all();
	for (auto &worker : workers) {
		if (worker.joinable()) {
			worker.join();
		}
	}
}

void LocalPoolExecutor::WorkerLoop() {
	while (true) {
		LineBatch batch;
		{
			std::unique_lock<std::mutex> guard(lock);
			work_available.wait(guard, [&] { return shutdown || !queue.empty(); });
			if (shutdown) {
				return;
			}
			batch = std::move(queue.front());
			queue.pop_front();
		}

		BatchResult result = MatchBatch(pattern, column_count, batch, token, max_line_length);

		{
			std::lock_guard<std::mutex> guard(lock);
			completed.push_back(std::move(result));
		}
		work_completed.notify_one();
	}
}

void LocalPoolExecutor::Submit(LineBatch batch) {
	{
		std::lock_guard<std::mutex> guard(lock);
		queue.push_back(std::move(batch));
		outstanding++;
	}
	work_available.notify_one();
}

bool LocalPoolExecutor::Next(BatchResult &result) {
	std::unique_lock<std::mutex> guard(lock);
	if (outstanding == 0) {
		return false;
	}
	work_completed.wait(guard, [&] { return !completed.empty(); });
	result = std::move(completed.front());
	completed.pop_front();
	outstanding--;
	return true;
}

void LocalPoolExecutor::CancelAfter(idx_t sequence) {
	token.CancelAfter(sequence);

	std::lock_guard<std::mutex> guard(lock);
	// Queued batches past the cut are never started
	for (auto it = queue.begin(); it != queue.end();) {
		if (it->sequence > sequence) {
			BatchResult cancelled;
			cancelled.sequence = it->sequence;
			cancelled.cancelled = true;
			completed.push_back(std::move(cancelled));
			it = queue.erase(it);
		} else {
			++it;
		}
	}
	work_completed.notify_one();
}

idx_t LocalPoolExecutor::Outstanding() const {
	std::lock_guard<std::mutex> guard(lock);
	return outstanding;
}

unique_ptr<BatchExecutor> CreateBatchExecutor(ClientContext &context, BackendType backend,
                                              const CompiledPattern &pattern, idx_t column_count,
                                              idx_t thread_count, idx_t max_line_length) {
	switch (backend) {
	case BackendType::LOCAL:
		return make_uniq<LocalPoolExecutor>(pattern, column_count, thread_count, max_line_length);
	case BackendType::SCHEDULER:
		return make_uniq<SchedulerExecutor>(context, pattern, column_count, max_line_length);
	default:
		throw InternalException("Unsupported regex_log backend");
	}
}

} // namespace regex_log
} // namespace duckdb

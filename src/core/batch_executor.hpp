#pragma once

#include "duckdb.hpp"
#include "duckdb/main/client_context.hpp"
#include "include/regex_log_types.hpp"
#include "compiled_pattern.hpp"
#include "match_worker.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace duckdb {
namespace regex_log {

/**
 * Execution substrate for the dispatcher: runs the match worker over
 * submitted batches and hands back completed results.
 *
 * Implementations may complete batches in any order; the dispatcher uses
 * BatchResult::sequence to restore canonical order. Only the dispatcher's
 * coordinating thread calls into an executor.
 */
class BatchExecutor {
public:
	virtual ~BatchExecutor() = default;

	// Queue a batch for matching
	virtual void Submit(LineBatch batch) = 0;

	/**
	 * Wait for the next completed batch.
	 * Returns false if no submitted batch is outstanding.
	 */
	virtual bool Next(BatchResult &result) = 0;

	/**
	 * Abandon every batch with a sequence number above the given one.
	 * Abandoned batches are still returned by Next(), marked cancelled.
	 */
	virtual void CancelAfter(idx_t sequence) = 0;

	// Batches submitted but not yet returned by Next()
	virtual idx_t Outstanding() const = 0;

	// Number of batches that can be matched at the same time
	virtual idx_t Concurrency() const = 0;

	virtual std::string Name() const = 0;
};

/**
 * A pool of worker threads owned by one parse invocation.
 * Threads start in the constructor and are joined in the destructor, which
 * also abandons queued work, so an exception unwinding the invocation tears
 * the pool down.
 */
class LocalPoolExecutor : public BatchExecutor {
public:
	LocalPoolExecutor(const CompiledPattern &pattern, idx_t column_count, idx_t thread_count,
	                  idx_t max_line_length = SafeParsing::MAX_REGEX_LINE_LENGTH);
	~LocalPoolExecutor() override;

	void Submit(LineBatch batch) override;
	bool Next(BatchResult &result) override;
	void CancelAfter(idx_t sequence) override;

	idx_t Outstanding() const override;
	idx_t Concurrency() const override {
		return workers.size();
	}
	std::string Name() const override {
		return "local";
	}

private:
	const CompiledPattern &pattern;
	idx_t column_count;
	idx_t max_line_length;
	CancellationToken token;

	mutable std::mutex lock;
	std::condition_variable work_available;
	std::condition_variable work_completed;
	std::deque<LineBatch> queue;
	std::deque<BatchResult> completed;
	idx_t outstanding = 0;
	bool shutdown = false;

	std::vector<std::thread> workers;

	void WorkerLoop();
	void Shutdown();
};

/**
 * Runs batches as tasks on the database's shared TaskScheduler.
 * Pending batches are scheduled as one wave when the dispatcher asks for
 * a result, and the wave is awaited as a whole before results are handed
 * back, so the wave size is bounded by the dispatcher's in-flight limit.
 */
class SchedulerExecutor : public BatchExecutor {
public:
	SchedulerExecutor(ClientContext &context, const CompiledPattern &pattern, idx_t column_count,
	                  idx_t max_line_length = SafeParsing::MAX_REGEX_LINE_LENGTH);

	void Submit(LineBatch batch) override;
	bool Next(BatchResult &result) override;
	void CancelAfter(idx_t sequence) override;

	idx_t Outstanding() const override {
		return outstanding;
	}
	idx_t Concurrency() const override;
	std::string Name() const override {
		return "scheduler";
	}

	idx_t WavesRun() const {
		return waves_run;
	}

private:
	ClientContext &context;
	const CompiledPattern &pattern;
	idx_t column_count;
	idx_t max_line_length;
	CancellationToken token;

	std::vector<LineBatch> pending;
	std::deque<BatchResult> completed;
	idx_t outstanding = 0;
	idx_t waves_run = 0;

	void RunWave();
};

/**
 * Create the executor for a backend.
 * @param thread_count Pool size for the local backend
 * @param max_line_length Longest line the workers hand to the regex engine
 */
unique_ptr<BatchExecutor> CreateBatchExecutor(ClientContext &context, BackendType backend,
                                              const CompiledPattern &pattern, idx_t column_count,
                                              idx_t thread_count,
                                              idx_t max_line_length = SafeParsing::MAX_REGEX_LINE_LENGTH);

} // namespace regex_log
} // namespace duckdb

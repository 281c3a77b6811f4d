#include "batch_executor.hpp"
#include "duckdb/parallel/task_executor.hpp"
#include "duckdb/parallel/task_scheduler.hpp"

namespace duckdb {
namespace regex_log {

// One batch matched on a scheduler thread; writes into a slot owned by the wave
class MatchBatchTask : public BaseExecutorTask {
public:
	MatchBatchTask(TaskExecutor &executor, const CompiledPattern &pattern_p, idx_t column_count_p,
	               idx_t max_line_length_p, const LineBatch &batch_p, const CancellationToken &token_p,
	               BatchResult &result_p)
	    : BaseExecutorTask(executor), pattern(pattern_p), column_count(column_count_p),
	      max_line_length(max_line_length_p), batch(batch_p), token(token_p), result(result_p) {
	}

	void ExecuteTask() override {
		result = MatchBatch(pattern, column_count, batch, token, max_line_length);
	}

private:
	const CompiledPattern &pattern;
	idx_t column_count;
	idx_t max_line_length;
	const LineBatch &batch;
	const CancellationToken &token;
	BatchResult &result;
};

SchedulerExecutor::SchedulerExecutor(ClientContext &context_p, const CompiledPattern &pattern_p,
                                     idx_t column_count_p, idx_t max_line_length_p)
    : context(context_p), pattern(pattern_p), column_count(column_count_p), max_line_length(max_line_length_p) {
}

idx_t SchedulerExecutor::Concurrency() const {
	return static_cast<idx_t>(TaskScheduler::GetScheduler(context).NumberOfThreads());
}

void SchedulerExecutor::Submit(LineBatch batch) {
	pending.push_back(std::move(batch));
	outstanding++;
}

void SchedulerExecutor::RunWave() {
	auto wave = std::move(pending);
	pending.clear();

	std::vector<BatchResult> results(wave.size());
	TaskExecutor executor(context);
	for (idx_t i = 0; i < wave.size(); i++) {
		if (token.IsCancelled(wave[i].sequence)) {
			results[i].sequence = wave[i].sequence;
			results[i].cancelled = true;
			continue;
		}
		executor.ScheduleTask(make_uniq<MatchBatchTask>(executor, pattern, column_count, max_line_length, wave[i],
		                                                  token, results[i]));
	}
	// Rethrows the first error pushed by a task
	executor.WorkOnTasks();
	waves_run++;

	for (auto &result : results) {
		completed.push_back(std::move(result));
	}
}

bool SchedulerExecutor::Next(BatchResult &result) {
	if (outstanding == 0) {
		return false;
	}
	if (completed.empty()) {
		RunWave();
	}
	result = std::move(completed.front());
	completed.pop_front();
	outstanding--;
	return true;
}

void SchedulerExecutor::CancelAfter(idx_t sequence) {
	token.CancelAfter(sequence);
}

} // namespace regex_log
} // namespace duckdb

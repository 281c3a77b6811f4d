#include "dispatcher.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/logging/logger.hpp"

namespace duckdb {
namespace regex_log {

static bool HasReadError(const LineBatch &batch) {
	for (const auto &record : batch.records) {
		if (record.IsReadError()) {
			return true;
		}
	}
	return false;
}

Dispatcher::Dispatcher(ClientContext &context_p, LineSource &source_p, BatchExecutor &executor_p,
                       DispatchOptions options_p)
    : context(context_p), source(source_p), executor(executor_p), options(options_p) {
	if (options.batch_size == 0 || options.max_inflight_batches == 0) {
		throw InternalException("regex_log dispatcher needs a positive batch size and in-flight limit");
	}
}

void Dispatcher::Stop(idx_t sequence) {
	if (!stats.stopped) {
		DUCKDB_LOG_DEBUG(context, StringUtil::Format("regex_log: failure in batch %s, cancelling later batches",
		                                             std::to_string(sequence)));
	}
	stats.stopped = true;
	executor.CancelAfter(sequence);
}

void Dispatcher::Release(BatchResult &result, ErrorPolicy &policy, TableAssembler &assembler) {
	for (auto &match : result.results) {
		if (policy.Admit(match)) {
			assembler.Append(match);
		}
	}
	in_flight--;
}

void Dispatcher::Run(ErrorPolicy &policy, TableAssembler &assembler) {
	bool raise = policy.Mode() == ErrorMode::RAISE;
	bool exhausted = false;
	idx_t next_sequence = 0;

	while (true) {
		// Keep the pipeline full
		while (!exhausted && !stats.stopped && in_flight < options.max_inflight_batches) {
			LineBatch batch;
			batch.sequence = next_sequence;
			if (!source.NextBatch(options.batch_size, batch)) {
				exhausted = true;
				break;
			}
			next_sequence++;
			bool read_error = raise && HasReadError(batch);
			stats.batches_dispatched++;
			stats.lines_dispatched += batch.records.size();
			executor.Submit(std::move(batch));
			in_flight++;
			if (read_error) {
				// The failure is known before matching: nothing after it is needed
				Stop(next_sequence - 1);
			}
		}
		if (in_flight == 0) {
			break;
		}

		BatchResult result;
		if (!executor.Next(result)) {
			throw InternalException("regex_log executor lost %s in-flight batches", std::to_string(in_flight));
		}
		if (result.cancelled) {
			stats.batches_cancelled++;
			in_flight--;
			continue;
		}
		if (raise && result.HasFailure()) {
			Stop(result.sequence);
		}

		if (!options.ordered) {
			Release(result, policy, assembler);
			continue;
		}
		reorder_buffer.emplace(result.sequence, std::move(result));
		auto entry = reorder_buffer.find(next_release);
		while (entry != reorder_buffer.end()) {
			Release(entry->second, policy, assembler);
			reorder_buffer.erase(entry);
			next_release++;
			entry = reorder_buffer.find(next_release);
		}
	}

	if (!reorder_buffer.empty()) {
		throw InternalException("regex_log dispatcher finished with %s unreleased batches",
		                        std::to_string(reorder_buffer.size()));
	}
}

} // namespace regex_log
} // namespace duckdb

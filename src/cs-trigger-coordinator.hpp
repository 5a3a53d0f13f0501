#pragma once

#include "cs-processing-queue.hpp"
#include "cs-recording-processor.hpp"

#include <QString>

namespace cs {

class ProcessingTracker;
class SummaryStore;

enum class ProcessDecision {
	Process,
	AlreadySummarized,
	InFlight,
};

const char *process_decision_to_key(ProcessDecision decision);

// The one place every trigger asks whether a call still needs work, and the
// guarded entry point that runs the pipeline under the tracker.
class TriggerCoordinator {
public:
	TriggerCoordinator(ProcessingTracker *tracker, SummaryStore *store, RecordingProcessor *processor);

	TriggerCoordinator(const TriggerCoordinator &) = delete;
	TriggerCoordinator &operator=(const TriggerCoordinator &) = delete;

	// Idempotent and side-effect free. A failed store read counts as "no summary".
	ProcessDecision should_process(const QString &call_id, bool force);

	// Acquires the tracker, re-checks the store, runs the pipeline and always
	// releases. Duplicates come back as SkippedDuplicate; ProcessingError
	// propagates to the caller.
	ProcessResult run_guarded(const QueueJob &job,
				  const RecordingProcessor::StageCallback &on_stage = RecordingProcessor::StageCallback());

	// Direct, non-queued run for push and polling triggers. Never throws.
	bool run_direct(const QueueJob &job, const char *trigger_tag);

	// Process function for the queue. Reports stages back to the queue.
	ProcessingQueue::ProcessFunction queue_process_function(ProcessingQueue *queue);

	ProcessingTracker *tracker() const { return m_tracker; }
	SummaryStore *store() const { return m_store; }

private:
	ProcessingTracker *m_tracker = nullptr;
	SummaryStore *m_store = nullptr;
	RecordingProcessor *m_processor = nullptr;
};

} // namespace cs

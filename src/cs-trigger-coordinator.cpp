#include "cs-trigger-coordinator.hpp"

#include "cs-log.hpp"
#include "cs-processing-tracker.hpp"
#include "cs-summary-store.hpp"

namespace cs {

const char *process_decision_to_key(ProcessDecision decision)
{
	switch (decision) {
	case ProcessDecision::AlreadySummarized:
		return "already_processed";
	case ProcessDecision::InFlight:
		return "processing";
	case ProcessDecision::Process:
	default:
		return "process";
	}
}

TriggerCoordinator::TriggerCoordinator(ProcessingTracker *tracker, SummaryStore *store, RecordingProcessor *processor)
	: m_tracker(tracker),
	  m_store(store),
	  m_processor(processor)
{
}

ProcessDecision TriggerCoordinator::should_process(const QString &call_id, bool force)
{
	if (!force) {
		QString error;
		if (m_store->has_completed_summary(call_id, &error))
			return ProcessDecision::AlreadySummarized;
		if (!error.isEmpty())
			qCWarning(cs_log, "[store] summary lookup for %s failed: %s", qUtf8Printable(call_id),
				  qUtf8Printable(error));
	}
	if (m_tracker->is_processing(call_id))
		return ProcessDecision::InFlight;
	return ProcessDecision::Process;
}

ProcessResult TriggerCoordinator::run_guarded(const QueueJob &job, const RecordingProcessor::StageCallback &on_stage)
{
	ProcessResult skipped;
	skipped.kind = ProcessResultKind::SkippedDuplicate;
	skipped.call_id = job.call_id;
	skipped.recording_ref = job.recording_ref;

	TrackerLease lease(m_tracker, job.call_id);
	if (!lease.acquired()) {
		skipped.message = "Call is already being processed";
		qCInfo(cs_log, "[tracker] skipping %s: already being processed", qUtf8Printable(job.call_id));
		return skipped;
	}

	// Another trigger may have finished the call while this one waited.
	if (!job.force && m_store->has_completed_summary(job.call_id)) {
		skipped.message = "Summary already exists";
		qCInfo(cs_log, "[tracker] skipping %s: summary already exists", qUtf8Printable(job.call_id));
		return skipped;
	}

	return m_processor->process(job, on_stage);
}

bool TriggerCoordinator::run_direct(const QueueJob &job, const char *trigger_tag)
{
	try {
		const ProcessResult result = run_guarded(job);
		qCInfo(cs_log, "[%s] %s finished: %s", trigger_tag, qUtf8Printable(job.call_id),
		       process_result_kind_to_key(result.kind));
		return true;
	} catch (const std::exception &e) {
		qCWarning(cs_log, "[%s] auto-processing failed for %s: %s", trigger_tag, qUtf8Printable(job.call_id),
			  e.what());
		return false;
	}
}

ProcessingQueue::ProcessFunction TriggerCoordinator::queue_process_function(ProcessingQueue *queue)
{
	return [this, queue](const QueueJob &job) {
		const ProcessResult result =
			run_guarded(job, [queue, &job](ProcessingStage stage) { queue->update_stage(job.call_id, stage); });
		qCInfo(cs_log, "[queue] %s outcome: %s", qUtf8Printable(job.call_id),
		       process_result_kind_to_key(result.kind));
	};
}

} // namespace cs

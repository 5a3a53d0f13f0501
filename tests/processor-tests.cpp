#include "cs-analysis-backend.hpp"
#include "cs-config.hpp"
#include "cs-processing-queue.hpp"
#include "cs-processing-tracker.hpp"
#include "cs-recording-processor.hpp"
#include "cs-summary-store.hpp"
#include "cs-trigger-coordinator.hpp"
#include "test-support.hpp"

#include <QTemporaryDir>
#include <QVector>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

using cs_test::wait_until;

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Processor test failed: " << message << std::endl;
	std::exit(1);
}

// Store, fakes and pipeline wired together over a temporary directory.
struct Fixture {
	QTemporaryDir temp_dir;
	cs_test::FakePbxClient pbx;
	cs_test::FakeAnalysisBackend backend;
	std::unique_ptr<cs::SummaryStore> store;
	std::unique_ptr<cs::RecordingProcessor> processor;
	cs::ProcessingTracker tracker;
	std::unique_ptr<cs::TriggerCoordinator> coordinator;

	explicit Fixture(int inference_slots = 3)
	{
		require(temp_dir.isValid(), "temporary directory created");
		pbx.audio_path = cs_test::write_fake_audio(temp_dir.path());
		store = std::make_unique<cs::SummaryStore>(temp_dir.filePath("summaries.db"));
		QString error;
		require(store->open(&error), "store opens");

		cs::ProcessorOptions options;
		options.page_size = 2;
		options.recording_lookup_pages = 3;
		options.max_concurrent_inference = inference_slots;
		processor = std::make_unique<cs::RecordingProcessor>(&pbx, &backend, store.get(), options);
		coordinator = std::make_unique<cs::TriggerCoordinator>(&tracker, store.get(), processor.get());
	}
};

QJsonObject recording_entry(const QString &uid, const QString &file)
{
	QJsonObject entry;
	entry.insert("uid", uid);
	entry.insert("file", file);
	return entry;
}

void test_full_pipeline_with_stages()
{
	Fixture fixture;
	std::vector<cs::ProcessingStage> stages;
	QJsonObject published;
	fixture.processor->set_analysis_listener([&](const QJsonObject &summary) { published = summary; });

	cs::QueueJob job;
	job.call_id = "call-1";
	job.recording_ref = "20251211160749-1765454864.23722-201-0556195159-Outbound.wav";
	const cs::ProcessResult result =
		fixture.processor->process(job, [&](cs::ProcessingStage stage) { stages.push_back(stage); });

	require(result.kind == cs::ProcessResultKind::Analyzed, "call analyzed");
	require(stages == std::vector<cs::ProcessingStage>({cs::ProcessingStage::Downloading,
							    cs::ProcessingStage::Transcribing,
							    cs::ProcessingStage::Analyzing, cs::ProcessingStage::Saving}),
		"stages reported in order");
	require(fixture.backend.context().contains("Extension: 201"), "file name context passed to analysis");

	const std::optional<cs::SummaryRecord> record = fixture.store->find("call-1");
	require(record && !record->has_error(), "summary saved without error");
	require(record->sentiment == "positive", "sentiment taken from mood analysis");
	require(record->model_used == "fake-model", "model recorded");
	require(record->analysis.value("call_direction").toString() == "outbound", "direction added to analysis");
	require(published.value("call_id").toString() == "call-1", "listener notified");
}

void test_recording_lookup_scans_pages()
{
	Fixture fixture;
	fixture.pbx.recordings.push_back(recording_entry("other-1", "o1.wav"));
	fixture.pbx.recordings.push_back(recording_entry("other-2", "o2.wav"));
	fixture.pbx.recordings.push_back(recording_entry("call-2", "found-201-Inbound.wav"));

	cs::QueueJob job;
	job.call_id = "call-2";
	const cs::ProcessResult result = fixture.processor->process(job);
	require(result.kind == cs::ProcessResultKind::Analyzed, "call with looked-up recording analyzed");
	require(result.recording_ref == "found-201-Inbound.wav", "recording found on second page");
	require(fixture.pbx.recording_page_requests.load() == 2, "lookup stopped once found");
}

void test_missing_recording_is_terminal()
{
	Fixture fixture;
	fixture.pbx.recordings.push_back(recording_entry("other-1", "o1.wav"));

	cs::QueueJob job;
	job.call_id = "call-3";
	const cs::ProcessResult result = fixture.processor->process(job);
	require(result.kind == cs::ProcessResultKind::NoRecording, "missing recording is a business outcome");
	require(fixture.pbx.recording_page_requests.load() == 1, "short page ends the lookup");
	const std::optional<cs::SummaryRecord> record = fixture.store->find("call-3");
	require(record && record->error_message == "No recording available for this call", "outcome persisted");
	require(fixture.backend.transcribe_calls.load() == 0, "no inference without a recording");
}

void test_insufficient_transcript_is_terminal()
{
	Fixture fixture;
	fixture.backend.transcript = "beep beep beep beep beep beep";

	cs::QueueJob job;
	job.call_id = "call-4";
	job.recording_ref = "short.wav";
	const cs::ProcessResult result = fixture.processor->process(job);
	require(result.kind == cs::ProcessResultKind::InsufficientContent, "insufficient content recognized");
	require(fixture.backend.analyze_calls.load() == 0, "analysis skipped");

	const std::optional<cs::SummaryRecord> record = fixture.store->find("call-4");
	require(record && !record->has_error(), "insufficient data is stored as a summary");
	require(record->call_type == "insufficient_data", "call type marks insufficient data");
	require(fixture.store->has_completed_summary("call-4"), "no further processing needed");
}

void test_retryable_failure_throws_and_records()
{
	Fixture fixture;
	fixture.backend.failure = "ASR server returned HTTP 503";

	cs::QueueJob job;
	job.call_id = "call-5";
	job.recording_ref = "rec.wav";
	bool thrown = false;
	try {
		fixture.processor->process(job);
	} catch (const cs::ProcessingError &e) {
		thrown = QString::fromUtf8(e.what()) == "ASR server returned HTTP 503";
	}
	require(thrown, "backend failure raises ProcessingError");
	const std::optional<cs::SummaryRecord> record = fixture.store->find("call-5");
	require(record && record->error_message == "ASR server returned HTTP 503", "failure recorded");

	fixture.backend.failure.clear();
	job.recording_ref = "missing-file.wav";
	thrown = false;
	try {
		fixture.processor->process(job);
	} catch (const cs::ProcessingError &) {
		thrown = true;
	}
	require(thrown, "download url failure raises ProcessingError");
}

void test_should_process_decisions()
{
	Fixture fixture;
	require(fixture.coordinator->should_process("call-6", false) == cs::ProcessDecision::Process, "new call processed");

	fixture.tracker.try_acquire("call-6");
	require(fixture.coordinator->should_process("call-6", false) == cs::ProcessDecision::InFlight, "held call in flight");
	fixture.tracker.release("call-6");

	QString error;
	require(fixture.store->save_error("call-6", "timeout", QString(), &error), "store error row");
	require(fixture.coordinator->should_process("call-6", false) == cs::ProcessDecision::Process,
		"errored call processed again");

	cs::SummaryRecord record;
	record.call_id = "call-6";
	record.summary = "done";
	require(fixture.store->upsert_summary(record, &error), "store summary");
	require(fixture.coordinator->should_process("call-6", false) == cs::ProcessDecision::AlreadySummarized,
		"summarized call skipped");
	require(fixture.coordinator->should_process("call-6", true) == cs::ProcessDecision::Process, "force reprocesses");
}

void test_guarded_run_skips_duplicates()
{
	Fixture fixture;
	cs::QueueJob job;
	job.call_id = "call-7";
	job.recording_ref = "rec.wav";

	fixture.tracker.try_acquire("call-7");
	const cs::ProcessResult held = fixture.coordinator->run_guarded(job);
	require(held.kind == cs::ProcessResultKind::SkippedDuplicate, "held call skipped");
	require(fixture.backend.transcribe_calls.load() == 0, "skipped call does no work");
	fixture.tracker.release("call-7");

	require(fixture.coordinator->run_guarded(job).kind == cs::ProcessResultKind::Analyzed, "free call processed");
	require(fixture.tracker.active_count() == 0, "tracker released after success");
	require(fixture.coordinator->run_guarded(job).kind == cs::ProcessResultKind::SkippedDuplicate,
		"summarized call skipped at execution time");

	fixture.backend.failure = "llm timeout";
	job.force = true;
	require(!fixture.coordinator->run_direct(job, "test"), "direct run reports failure");
	require(fixture.tracker.active_count() == 0, "tracker released after failure");
}

void test_inference_is_bounded()
{
	Fixture fixture(2);
	fixture.backend.delay_ms = 30;

	std::vector<std::unique_ptr<QThread>> threads;
	for (int i = 0; i < 6; ++i) {
		cs::QueueJob job;
		job.call_id = QString("parallel-%1").arg(i);
		job.recording_ref = "rec.wav";
		cs::TriggerCoordinator *coordinator = fixture.coordinator.get();
		threads.emplace_back(QThread::create([coordinator, job]() { coordinator->run_direct(job, "test"); }));
		threads.back()->start();
	}
	for (auto &thread : threads)
		require(thread->wait(20000), "direct run finished");

	require(fixture.backend.max_active.load() <= 2, "inference gate bounds concurrency");
	require(fixture.backend.analyze_calls.load() == 6, "every call analyzed");
	require(fixture.processor->available_inference_slots() == 2, "all slots returned");
}

void test_queue_drives_pipeline()
{
	Fixture fixture;
	cs::QueueOptions options;
	options.retry_base_delay_ms = 10;
	cs::ProcessingQueue queue(options);
	queue.set_process_function(fixture.coordinator->queue_process_function(&queue));

	std::mutex stages_mutex;
	QStringList stages;
	queue.set_broadcast_function([&](const QJsonObject &status) {
		const QString stage = status.value("processing_item").toObject().value("stage").toString();
		std::lock_guard<std::mutex> lock(stages_mutex);
		if (!stage.isEmpty() && !stages.contains(stage))
			stages.push_back(stage);
	});

	queue.add("queued-1", "queued-201-Inbound.wav");
	fixture.tracker.try_acquire("queued-2");
	queue.add("queued-2", "queued-202-Inbound.wav");
	queue.start();

	require(wait_until([&]() { return queue.get_status().recent_completed.size() == 2; }), "both items complete");
	require(fixture.store->has_completed_summary("queued-1"), "queued call summarized");
	require(!fixture.store->find("queued-2"), "call held elsewhere is skipped, not processed");
	fixture.tracker.release("queued-2");

	std::lock_guard<std::mutex> lock(stages_mutex);
	require(stages.contains("downloading") && stages.contains("saving"), "stages broadcast while running");
}

void test_transcribe_rejects_unreadable_audio()
{
	QTemporaryDir temp_dir;
	require(temp_dir.isValid(), "temporary directory created");
	cs::AnalysisConfig config;
	config.asr_url = "http://127.0.0.1:9/inference";
	cs::HttpAnalysisBackend backend(config);

	cs::Transcription transcription;
	QString error;
	require(!backend.transcribe(temp_dir.filePath("absent.wav"), &transcription, &error),
		"missing audio file fails before any request");
	require(error.startsWith("Failed to open audio file"), "open failure reported");
	require(transcription.text.isEmpty(), "no transcript produced");
}

} // namespace

void run_processor_tests()
{
	test_full_pipeline_with_stages();
	test_recording_lookup_scans_pages();
	test_missing_recording_is_terminal();
	test_insufficient_transcript_is_terminal();
	test_retryable_failure_throws_and_records();
	test_should_process_decisions();
	test_guarded_run_skips_duplicates();
	test_inference_is_bounded();
	test_queue_drives_pipeline();
	test_transcribe_rejects_unreadable_audio();
}

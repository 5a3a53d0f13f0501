#include "cs-recording-processor.hpp"

#include "cs-analysis-backend.hpp"
#include "cs-http-client.hpp"
#include "cs-log.hpp"
#include "cs-pbx-client.hpp"
#include "cs-summary-store.hpp"
#include "cs-transcript.hpp"

#include <QElapsedTimer>
#include <QFileInfo>
#include <QSemaphoreReleaser>
#include <QTemporaryDir>
#include <QUrl>

namespace cs {
namespace {

constexpr const char *kNoRecordingMessage = "No recording available for this call";
constexpr const char *kInsufficientSummary = "Not enough data to generate analysis. The call may contain only "
					     "ringing, background noise, or minimal interaction.";

QString local_file_name(const QString &recording_ref)
{
	const QString name = QFileInfo(recording_ref).fileName();
	if (name.isEmpty())
		return "recording.wav";
	return name;
}

} // namespace

const char *process_result_kind_to_key(ProcessResultKind kind)
{
	switch (kind) {
	case ProcessResultKind::NoRecording:
		return "no_recording";
	case ProcessResultKind::InsufficientContent:
		return "insufficient_data";
	case ProcessResultKind::SkippedDuplicate:
		return "skipped_duplicate";
	case ProcessResultKind::Analyzed:
	default:
		return "analyzed";
	}
}

RecordingProcessor::RecordingProcessor(PbxClient *pbx, AnalysisBackend *backend, SummaryStore *store,
				       const ProcessorOptions &options)
	: m_pbx(pbx),
	  m_backend(backend),
	  m_store(store),
	  m_options(options),
	  m_inference_gate(options.max_concurrent_inference > 0 ? options.max_concurrent_inference : 1)
{
}

void RecordingProcessor::set_analysis_listener(AnalysisListener listener)
{
	m_analysis_listener = std::move(listener);
}

int RecordingProcessor::available_inference_slots() const
{
	return m_inference_gate.available();
}

ProcessResult RecordingProcessor::process(const QueueJob &job, const StageCallback &on_stage)
{
	const auto set_stage = [&on_stage](ProcessingStage stage) {
		if (on_stage)
			on_stage(stage);
	};

	QElapsedTimer timer;
	timer.start();

	ProcessResult result;
	result.call_id = job.call_id;
	result.recording_ref = job.recording_ref;
	qCInfo(cs_log, "[processor] processing %s (recording=%s, force=%s)", qUtf8Printable(job.call_id),
	       job.recording_ref.isEmpty() ? "<lookup>" : qUtf8Printable(job.recording_ref), job.force ? "true" : "false");

	if (result.recording_ref.isEmpty())
		result.recording_ref = resolve_recording(job.call_id);

	if (result.recording_ref.isEmpty()) {
		qCWarning(cs_log, "[processor] no recording found for %s", qUtf8Printable(job.call_id));
		QString error;
		if (!m_store->save_error(job.call_id, kNoRecordingMessage, QString(), &error))
			throw ProcessingError(QString("Failed to save outcome for %1: %2").arg(job.call_id, error));
		result.kind = ProcessResultKind::NoRecording;
		result.message = kNoRecordingMessage;
		return result;
	}

	set_stage(ProcessingStage::Downloading);
	QUrl download_url;
	QString error;
	if (!m_pbx->resolve_download_url(result.recording_ref, &download_url, &error))
		fail(job.call_id, result.recording_ref, error);

	// Removed with everything in it on every exit path.
	QTemporaryDir temp_dir;
	if (!temp_dir.isValid())
		fail(job.call_id, result.recording_ref, "Failed to create temporary directory");
	const QString audio_path = temp_dir.filePath(local_file_name(result.recording_ref));
	qint64 bytes = 0;
	if (!http_download(download_url, audio_path, m_options.download_timeout_ms, &bytes, &error))
		fail(job.call_id, result.recording_ref, error);
	if (bytes == 0)
		fail(job.call_id, result.recording_ref, "Downloaded recording is empty");

	set_stage(ProcessingStage::Transcribing);
	Transcription transcription;
	{
		m_inference_gate.acquire();
		QSemaphoreReleaser releaser(m_inference_gate);
		if (!m_backend->transcribe(audio_path, &transcription, &error))
			fail(job.call_id, result.recording_ref, error);
	}

	SummaryRecord record;
	record.call_id = job.call_id;
	record.recording_ref = result.recording_ref;
	record.language = transcription.language;
	record.transcript_preview = transcript_preview(transcription.text);

	const RecordingContext context = recording_context_from_file_name(result.recording_ref);
	const TranscriptCheck check = validate_transcript(transcription.text);
	if (!check.valid) {
		qCInfo(cs_log, "[processor] transcript for %s not valid for analysis: %s", qUtf8Printable(job.call_id),
		       qUtf8Printable(check.reason));
		set_stage(ProcessingStage::Saving);
		record.call_type = "insufficient_data";
		record.summary = kInsufficientSummary;
		record.sentiment = "neutral";
		record.analysis.insert("call_type", record.call_type);
		record.analysis.insert("summary", record.summary);
		record.analysis.insert("insufficient_data_reason", check.reason);
		if (!context.staff_extension.isEmpty())
			record.analysis.insert("staff_extension", context.staff_extension);
		if (!context.call_direction.isEmpty())
			record.analysis.insert("call_direction", context.call_direction);
		record.model_used = "none - insufficient data";
		record.processing_seconds = timer.elapsed() / 1000.0;
		if (!m_store->upsert_summary(record, &error))
			fail(job.call_id, result.recording_ref, error);

		result.kind = ProcessResultKind::InsufficientContent;
		result.message = check.reason;
		return result;
	}

	set_stage(ProcessingStage::Analyzing);
	Analysis analysis;
	{
		m_inference_gate.acquire();
		QSemaphoreReleaser releaser(m_inference_gate);
		if (!m_backend->analyze(transcription.text, context.to_prompt_text(), &analysis, &error))
			fail(job.call_id, result.recording_ref, error);
	}

	if (!context.staff_extension.isEmpty() && !analysis.data.contains("staff_extension"))
		analysis.data.insert("staff_extension", context.staff_extension);
	if (!context.call_direction.isEmpty() && !analysis.data.contains("call_direction"))
		analysis.data.insert("call_direction", context.call_direction);

	set_stage(ProcessingStage::Saving);
	record.call_type = analysis.data.value("call_type").toString();
	record.summary = analysis.data.value("summary").toString();
	record.sentiment = sentiment_from_analysis(analysis.data);
	record.analysis = analysis.data;
	record.model_used = analysis.model_used;
	record.processing_seconds = timer.elapsed() / 1000.0;
	if (!m_store->upsert_summary(record, &error))
		fail(job.call_id, result.recording_ref, error);

	qCInfo(cs_log, "[processor] saved summary for %s in %.1fs", qUtf8Printable(job.call_id),
	       record.processing_seconds);
	if (m_analysis_listener)
		m_analysis_listener(summary_record_to_json(record));

	result.kind = ProcessResultKind::Analyzed;
	result.message = record.summary;
	return result;
}

QString RecordingProcessor::resolve_recording(const QString &call_id)
{
	QString recording_ref;
	QString error;
	if (!find_recording_for_call(m_pbx, call_id, m_options.recording_lookup_pages, m_options.page_size,
				     &recording_ref, &error))
		fail(call_id, QString(), QString("Recording lookup failed: %1").arg(error));
	return recording_ref;
}

void RecordingProcessor::fail(const QString &call_id, const QString &recording_ref, const QString &message)
{
	qCWarning(cs_log, "[processor] %s failed: %s", qUtf8Printable(call_id), qUtf8Printable(message));
	QString store_error;
	if (!m_store->save_error(call_id, message, recording_ref, &store_error))
		qCWarning(cs_log, "[processor] could not record error for %s: %s", qUtf8Printable(call_id),
			  qUtf8Printable(store_error));
	throw ProcessingError(message);
}

} // namespace cs

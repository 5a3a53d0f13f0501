#pragma once

#include "cs-queue-item.hpp"

#include <QJsonObject>
#include <QSemaphore>
#include <QString>

#include <functional>
#include <stdexcept>

namespace cs {

class AnalysisBackend;
class PbxClient;
class SummaryStore;

// Retryable pipeline failure: network, model timeout, storage error.
class ProcessingError : public std::runtime_error {
public:
	explicit ProcessingError(const QString &message) : std::runtime_error(message.toStdString()) {}
};

enum class ProcessResultKind {
	Analyzed,
	NoRecording,
	InsufficientContent,
	SkippedDuplicate,
};

struct ProcessResult {
	ProcessResultKind kind = ProcessResultKind::Analyzed;
	QString call_id;
	QString recording_ref;
	QString message;
};

const char *process_result_kind_to_key(ProcessResultKind kind);

struct ProcessorOptions {
	int recording_lookup_pages = 20;
	int page_size = 100;
	int download_timeout_ms = 60000;
	int max_concurrent_inference = 3;
};

// Download, transcribe, analyze and save one call recording. process() may be
// called from several threads at once; transcription and analysis calls are
// bounded process-wide by the inference gate.
class RecordingProcessor {
public:
	using StageCallback = std::function<void(ProcessingStage stage)>;
	using AnalysisListener = std::function<void(const QJsonObject &summary)>;

	RecordingProcessor(PbxClient *pbx, AnalysisBackend *backend, SummaryStore *store,
			   const ProcessorOptions &options);

	RecordingProcessor(const RecordingProcessor &) = delete;
	RecordingProcessor &operator=(const RecordingProcessor &) = delete;

	// Called from the processing thread after each successful analysis.
	void set_analysis_listener(AnalysisListener listener);

	// Throws ProcessingError on retryable failures. Terminal business outcomes
	// are persisted and returned.
	ProcessResult process(const QueueJob &job, const StageCallback &on_stage = StageCallback());

	int available_inference_slots() const;

private:
	QString resolve_recording(const QString &call_id);
	[[noreturn]] void fail(const QString &call_id, const QString &recording_ref, const QString &message);

	PbxClient *m_pbx = nullptr;
	AnalysisBackend *m_backend = nullptr;
	SummaryStore *m_store = nullptr;
	ProcessorOptions m_options;
	QSemaphore m_inference_gate;
	AnalysisListener m_analysis_listener;
};

} // namespace cs

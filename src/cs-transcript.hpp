#pragma once

#include <QJsonObject>
#include <QString>

namespace cs {

struct TranscriptCheck {
	bool valid = false;
	QString reason;
};

// Rejects transcripts that only hold ringing, noise or a word or two.
TranscriptCheck validate_transcript(const QString &transcript);

struct RecordingContext {
	QString staff_extension;
	QString call_direction;

	QString to_prompt_text() const;
};

// File names look like 20251211160749-1765454864.23722-201-0556195159-Outbound.wav
RecordingContext recording_context_from_file_name(const QString &file_name);

// Pulls the JSON object out of a model response. Falls back to regex field
// extraction when the object does not parse.
QJsonObject parse_llm_response(const QString &response_text);

QString transcript_preview(const QString &transcript);
QString sentiment_from_analysis(const QJsonObject &analysis);

} // namespace cs

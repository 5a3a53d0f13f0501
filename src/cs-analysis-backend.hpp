#pragma once

#include "cs-config.hpp"

#include <QJsonObject>
#include <QString>

namespace cs {

struct Transcription {
	QString text;
	QString language;
};

struct Analysis {
	QJsonObject data;
	QString model_used;
};

// Speech recognition and transcript analysis. Implementations block the calling
// thread and must be safe to call from several threads at once.
class AnalysisBackend {
public:
	virtual ~AnalysisBackend() = default;

	virtual bool transcribe(const QString &audio_path, Transcription *out, QString *error) = 0;
	virtual bool analyze(const QString &transcript, const QString &context, Analysis *out, QString *error) = 0;
};

// whisper.cpp server (/inference, multipart "file") for ASR and an Ollama
// /api/generate endpoint for analysis.
class HttpAnalysisBackend : public AnalysisBackend {
public:
	explicit HttpAnalysisBackend(const AnalysisConfig &config);

	bool transcribe(const QString &audio_path, Transcription *out, QString *error) override;
	bool analyze(const QString &transcript, const QString &context, Analysis *out, QString *error) override;

private:
	AnalysisConfig m_config;
};

QString build_analysis_prompt(const QString &transcript, const QString &context);

} // namespace cs

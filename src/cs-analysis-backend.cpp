#include "cs-analysis-backend.hpp"

#include "cs-http-client.hpp"
#include "cs-log.hpp"
#include "cs-transcript.hpp"

#include <QFile>
#include <QFileInfo>
#include <QHttpMultiPart>
#include <QJsonDocument>
#include <QNetworkRequest>
#include <QUrl>

#include <memory>

namespace cs {
namespace {

constexpr double kLlmTemperature = 0.3;
constexpr int kLlmMaxTokens = 2000;

const char *kPromptTemplate = R"(Analyze this phone call transcript between a STAFF member and a CUSTOMER.

RECORDING CONTEXT:
%1

TRANSCRIPT:
%2

Respond with a single JSON object and nothing else, using these fields:
{
  "call_type": "inquiry | complaint | follow_up | sales | support | other",
  "summary": "3-5 sentence summary of the conversation",
  "sentiment": "positive | neutral | negative",
  "staff_name": "name of the staff member or null",
  "customer_name": "name of the customer or null",
  "topics_discussed": ["..."],
  "customer_requests": ["..."],
  "staff_responses": ["..."],
  "action_items": ["..."],
  "resolution_status": "resolved | pending | escalated | unclear",
  "key_details": {
    "names_mentioned": "...",
    "numbers_mentioned": "...",
    "dates_mentioned": "...",
    "other_details": "..."
  }
})";

void set_error(QString *error, const QString &message)
{
	if (error)
		*error = message;
}

} // namespace

QString build_analysis_prompt(const QString &transcript, const QString &context)
{
	return QString::fromUtf8(kPromptTemplate).arg(context, transcript);
}

HttpAnalysisBackend::HttpAnalysisBackend(const AnalysisConfig &config) : m_config(config) {}

bool HttpAnalysisBackend::transcribe(const QString &audio_path, Transcription *out, QString *error)
{
	auto multipart = std::make_unique<QHttpMultiPart>(QHttpMultiPart::FormDataType);
	auto *file = new QFile(audio_path, multipart.get());
	if (!file->open(QIODevice::ReadOnly)) {
		set_error(error, QString("Failed to open audio file %1").arg(audio_path));
		return false;
	}

	QHttpPart file_part;
	file_part.setHeader(QNetworkRequest::ContentTypeHeader, "application/octet-stream");
	file_part.setHeader(QNetworkRequest::ContentDispositionHeader,
			    QString("form-data; name=\"file\"; filename=\"%1\"").arg(QFileInfo(audio_path).fileName()));
	file_part.setBodyDevice(file);
	multipart->append(file_part);

	QHttpPart format_part;
	format_part.setHeader(QNetworkRequest::ContentDispositionHeader, "form-data; name=\"response_format\"");
	format_part.setBody("json");
	multipart->append(format_part);

	QNetworkRequest request{QUrl(m_config.asr_url)};
	HttpReply reply;
	if (!http_post_multipart(request, multipart.get(), m_config.asr_timeout_ms, &reply, error))
		return false;

	QJsonObject response;
	if (!parse_json_object(reply.body, &response, error))
		return false;
	if (response.contains("error")) {
		set_error(error, QString("Transcription failed: %1").arg(response.value("error").toString()));
		return false;
	}

	out->text = response.value("text").toString().trimmed();
	out->language = response.value("language").toString();
	qCInfo(cs_log, "[processor] transcribed %s (%lld chars, language=%s)", qUtf8Printable(audio_path),
	       static_cast<long long>(out->text.size()), qUtf8Printable(out->language));
	return true;
}

bool HttpAnalysisBackend::analyze(const QString &transcript, const QString &context, Analysis *out, QString *error)
{
	QJsonObject options;
	options.insert("temperature", kLlmTemperature);
	options.insert("num_predict", kLlmMaxTokens);
	options.insert("num_ctx", m_config.llm_context_length);

	QJsonObject payload;
	payload.insert("model", m_config.llm_model);
	payload.insert("prompt", build_analysis_prompt(transcript, context));
	payload.insert("stream", false);
	payload.insert("options", options);

	QNetworkRequest request{QUrl(m_config.llm_url)};
	request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
	HttpReply reply;
	if (!http_post(request, QJsonDocument(payload).toJson(QJsonDocument::Compact), m_config.analysis_timeout_ms,
		       &reply, error))
		return false;

	QJsonObject response;
	if (!parse_json_object(reply.body, &response, error))
		return false;
	if (response.contains("error")) {
		set_error(error, QString("Analysis failed: %1").arg(response.value("error").toString()));
		return false;
	}

	out->data = parse_llm_response(response.value("response").toString());
	out->model_used = m_config.llm_model;
	return true;
}

} // namespace cs

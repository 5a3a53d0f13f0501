#include "cs-config.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

namespace cs {
namespace {

int positive_int(const QJsonObject &json_obj, const char *key, int fallback)
{
	const QJsonValue value = json_obj.value(key);
	if (!value.isDouble())
		return fallback;
	const int parsed = value.toInt(fallback);
	return parsed > 0 ? parsed : fallback;
}

int non_negative_int(const QJsonObject &json_obj, const char *key, int fallback)
{
	const QJsonValue value = json_obj.value(key);
	if (!value.isDouble())
		return fallback;
	const int parsed = value.toInt(fallback);
	return parsed >= 0 ? parsed : fallback;
}

QString string_value(const QJsonObject &json_obj, const char *key, const QString &fallback)
{
	const QJsonValue value = json_obj.value(key);
	return value.isString() ? value.toString() : fallback;
}

bool bool_value(const QJsonObject &json_obj, const char *key, bool fallback)
{
	const QJsonValue value = json_obj.value(key);
	return value.isBool() ? value.toBool() : fallback;
}

} // namespace

QJsonObject app_config_to_json(const AppConfig &config)
{
	QJsonObject http;
	http.insert("host", config.http.host);
	http.insert("port", config.http.port);
	http.insert("apiToken", config.http.api_token);

	QJsonObject hub;
	hub.insert("enabled", config.status_hub.enabled);
	hub.insert("port", config.status_hub.port);

	QJsonObject database;
	database.insert("sqlitePath", config.database.sqlite_path);

	QJsonObject pbx;
	pbx.insert("baseUrl", config.pbx.base_url);
	pbx.insert("accessToken", config.pbx.access_token);
	pbx.insert("requestTimeoutMs", config.pbx.request_timeout_ms);
	pbx.insert("recordingLookupPages", config.pbx.recording_lookup_pages);
	pbx.insert("pageSize", config.pbx.page_size);

	QJsonObject analysis;
	analysis.insert("asrUrl", config.analysis.asr_url);
	analysis.insert("llmUrl", config.analysis.llm_url);
	analysis.insert("llmModel", config.analysis.llm_model);
	analysis.insert("llmContextLength", config.analysis.llm_context_length);
	analysis.insert("asrTimeoutMs", config.analysis.asr_timeout_ms);
	analysis.insert("analysisTimeoutMs", config.analysis.analysis_timeout_ms);
	analysis.insert("downloadTimeoutMs", config.analysis.download_timeout_ms);
	analysis.insert("maxConcurrentInference", config.analysis.max_concurrent_inference);

	QJsonObject queue;
	queue.insert("maxRetries", config.queue.max_retries);
	queue.insert("retryBaseDelayMs", config.queue.retry_base_delay_ms);
	queue.insert("historyLimit", config.queue.history_limit);
	queue.insert("dispatchCooldownMs", config.queue.dispatch_cooldown_ms);
	queue.insert("maxResidencyMs", static_cast<qint64>(config.queue.max_residency_ms));

	QJsonObject triggers;
	triggers.insert("autoProcessCalls", config.triggers.auto_process_calls);
	triggers.insert("processInternalCalls", config.triggers.process_internal_calls);
	triggers.insert("pollerIntervalMs", config.triggers.poller_interval_ms);
	triggers.insert("pollerStartupDelayMs", config.triggers.poller_startup_delay_ms);
	triggers.insert("pollerPageSize", config.triggers.poller_page_size);
	triggers.insert("syncIntervalMs", config.triggers.sync_interval_ms);
	triggers.insert("syncStartupPages", config.triggers.sync_startup_pages);
	triggers.insert("syncLivePages", config.triggers.sync_live_pages);
	triggers.insert("webhookSettleDelayMs", config.triggers.webhook_settle_delay_ms);
	triggers.insert("webhookToken", config.triggers.webhook_token);

	QJsonObject root;
	root.insert("http", http);
	root.insert("statusHub", hub);
	root.insert("database", database);
	root.insert("pbx", pbx);
	root.insert("analysis", analysis);
	root.insert("queue", queue);
	root.insert("triggers", triggers);
	return root;
}

AppConfig app_config_from_json(const QJsonObject &json_obj)
{
	AppConfig config;

	const QJsonObject http = json_obj.value("http").toObject();
	config.http.host = string_value(http, "host", config.http.host);
	config.http.port = positive_int(http, "port", config.http.port);
	config.http.api_token = string_value(http, "apiToken", config.http.api_token);

	const QJsonObject hub = json_obj.value("statusHub").toObject();
	config.status_hub.enabled = bool_value(hub, "enabled", config.status_hub.enabled);
	config.status_hub.port = positive_int(hub, "port", config.status_hub.port);

	const QJsonObject database = json_obj.value("database").toObject();
	config.database.sqlite_path = string_value(database, "sqlitePath", config.database.sqlite_path);
	if (config.database.sqlite_path.trimmed().isEmpty())
		config.database.sqlite_path = DatabaseConfig{}.sqlite_path;

	const QJsonObject pbx = json_obj.value("pbx").toObject();
	config.pbx.base_url = string_value(pbx, "baseUrl", config.pbx.base_url);
	config.pbx.access_token = string_value(pbx, "accessToken", config.pbx.access_token);
	config.pbx.request_timeout_ms = positive_int(pbx, "requestTimeoutMs", config.pbx.request_timeout_ms);
	config.pbx.recording_lookup_pages = positive_int(pbx, "recordingLookupPages", config.pbx.recording_lookup_pages);
	config.pbx.page_size = positive_int(pbx, "pageSize", config.pbx.page_size);

	const QJsonObject analysis = json_obj.value("analysis").toObject();
	config.analysis.asr_url = string_value(analysis, "asrUrl", config.analysis.asr_url);
	config.analysis.llm_url = string_value(analysis, "llmUrl", config.analysis.llm_url);
	config.analysis.llm_model = string_value(analysis, "llmModel", config.analysis.llm_model);
	config.analysis.llm_context_length =
		positive_int(analysis, "llmContextLength", config.analysis.llm_context_length);
	config.analysis.asr_timeout_ms = positive_int(analysis, "asrTimeoutMs", config.analysis.asr_timeout_ms);
	config.analysis.analysis_timeout_ms =
		positive_int(analysis, "analysisTimeoutMs", config.analysis.analysis_timeout_ms);
	config.analysis.download_timeout_ms =
		positive_int(analysis, "downloadTimeoutMs", config.analysis.download_timeout_ms);
	config.analysis.max_concurrent_inference =
		positive_int(analysis, "maxConcurrentInference", config.analysis.max_concurrent_inference);

	const QJsonObject queue = json_obj.value("queue").toObject();
	config.queue.max_retries = positive_int(queue, "maxRetries", config.queue.max_retries);
	config.queue.retry_base_delay_ms = non_negative_int(queue, "retryBaseDelayMs", config.queue.retry_base_delay_ms);
	config.queue.history_limit = positive_int(queue, "historyLimit", config.queue.history_limit);
	config.queue.dispatch_cooldown_ms =
		non_negative_int(queue, "dispatchCooldownMs", config.queue.dispatch_cooldown_ms);
	const QJsonValue residency = queue.value("maxResidencyMs");
	if (residency.isDouble() && residency.toDouble() >= 0)
		config.queue.max_residency_ms = static_cast<qint64>(residency.toDouble());

	const QJsonObject triggers = json_obj.value("triggers").toObject();
	config.triggers.auto_process_calls = bool_value(triggers, "autoProcessCalls", config.triggers.auto_process_calls);
	config.triggers.process_internal_calls =
		bool_value(triggers, "processInternalCalls", config.triggers.process_internal_calls);
	config.triggers.poller_interval_ms = positive_int(triggers, "pollerIntervalMs", config.triggers.poller_interval_ms);
	config.triggers.poller_startup_delay_ms =
		non_negative_int(triggers, "pollerStartupDelayMs", config.triggers.poller_startup_delay_ms);
	config.triggers.poller_page_size = positive_int(triggers, "pollerPageSize", config.triggers.poller_page_size);
	config.triggers.sync_interval_ms = positive_int(triggers, "syncIntervalMs", config.triggers.sync_interval_ms);
	config.triggers.sync_startup_pages = positive_int(triggers, "syncStartupPages", config.triggers.sync_startup_pages);
	config.triggers.sync_live_pages = positive_int(triggers, "syncLivePages", config.triggers.sync_live_pages);
	config.triggers.webhook_settle_delay_ms =
		non_negative_int(triggers, "webhookSettleDelayMs", config.triggers.webhook_settle_delay_ms);
	config.triggers.webhook_token = string_value(triggers, "webhookToken", config.triggers.webhook_token);

	return config;
}

bool load_app_config(const QString &path, AppConfig *out_config, QString *error)
{
	QFile file(path);
	if (!file.exists()) {
		*out_config = AppConfig{};
		return true;
	}
	if (!file.open(QIODevice::ReadOnly)) {
		if (error)
			*error = QString("Failed to open config file: %1").arg(path);
		return false;
	}

	QJsonParseError parse_error;
	const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parse_error);
	if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
		if (error)
			*error = QString("Invalid config file %1: %2").arg(path, parse_error.errorString());
		return false;
	}

	*out_config = app_config_from_json(doc.object());
	return true;
}

bool save_app_config(const QString &path, const AppConfig &config)
{
	QFileInfo info(path);
	QDir dir = info.dir();
	if (!dir.exists() && !dir.mkpath("."))
		return false;

	QSaveFile file(path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
		return false;
	if (file.write(QJsonDocument(app_config_to_json(config)).toJson(QJsonDocument::Indented)) == -1)
		return false;
	return file.commit();
}

} // namespace cs

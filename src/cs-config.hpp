#pragma once

#include <QJsonObject>
#include <QString>

namespace cs {

struct HttpConfig {
	QString host = "0.0.0.0";
	int port = 8000;
	QString api_token;
};

struct StatusHubConfig {
	bool enabled = true;
	int port = 8002;
};

struct DatabaseConfig {
	QString sqlite_path = "callscribe.db";
};

struct PbxConfig {
	QString base_url;
	QString access_token;
	int request_timeout_ms = 30000;
	int recording_lookup_pages = 20;
	int page_size = 100;
};

struct AnalysisConfig {
	QString asr_url = "http://localhost:8080/inference";
	QString llm_url = "http://localhost:11434/api/generate";
	QString llm_model = "llama3.1:8b";
	int llm_context_length = 16384;
	int asr_timeout_ms = 600000;
	int analysis_timeout_ms = 300000;
	int download_timeout_ms = 60000;
	int max_concurrent_inference = 3;
};

struct QueueConfig {
	int max_retries = 3;
	int retry_base_delay_ms = 5000;
	int history_limit = 50;
	int dispatch_cooldown_ms = 1000;
	qint64 max_residency_ms = 3600000;
};

struct TriggerConfig {
	bool auto_process_calls = true;
	bool process_internal_calls = false;
	int poller_interval_ms = 30000;
	int poller_startup_delay_ms = 10000;
	int poller_page_size = 50;
	int sync_interval_ms = 300000;
	int sync_startup_pages = 20;
	int sync_live_pages = 5;
	int webhook_settle_delay_ms = 5000;
	QString webhook_token;
};

struct AppConfig {
	HttpConfig http;
	StatusHubConfig status_hub;
	DatabaseConfig database;
	PbxConfig pbx;
	AnalysisConfig analysis;
	QueueConfig queue;
	TriggerConfig triggers;
};

QJsonObject app_config_to_json(const AppConfig &config);
AppConfig app_config_from_json(const QJsonObject &json_obj);

// A missing file yields the defaults; an unreadable or malformed file fails.
bool load_app_config(const QString &path, AppConfig *out_config, QString *error);
bool save_app_config(const QString &path, const AppConfig &config);

} // namespace cs

#pragma once

#include "cs-config.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <memory>

class QHttpServer;
class QTcpServer;

namespace cs {

class ProcessingQueue;
class ProcessingTracker;
class StatusHub;
class TriggerCoordinator;
class WebhookReceiver;

struct ApiResponse {
	int status_code = 200;
	QJsonObject body;
};

// JSON request handling for the foreground trigger and the operator views.
// The handle_* methods carry the logic; bind() attaches them to QHttpServer
// routes. Everything runs on the owning (main) thread.
class HttpApi {
public:
	HttpApi(const HttpConfig &config, ProcessingQueue *queue, TriggerCoordinator *coordinator,
		ProcessingTracker *tracker, WebhookReceiver *webhook, StatusHub *hub = nullptr);
	~HttpApi();

	HttpApi(const HttpApi &) = delete;
	HttpApi &operator=(const HttpApi &) = delete;

	bool listen(QString *error);
	void close();
	quint16 port() const;

	bool authorized(const QByteArray &authorization_header) const;

	ApiResponse handle_process(const QString &call_id, bool force, const QString &recording_ref);
	ApiResponse handle_batch(const QByteArray &body);
	ApiResponse handle_status() const;
	ApiResponse handle_clear();
	ApiResponse handle_summary(const QString &call_id);
	ApiResponse handle_health() const;
	ApiResponse handle_webhook(const QByteArray &body, const QString &provided_token, bool force_new_cdr);

private:
	void register_routes();

	HttpConfig m_config;
	ProcessingQueue *m_queue = nullptr;
	TriggerCoordinator *m_coordinator = nullptr;
	ProcessingTracker *m_tracker = nullptr;
	WebhookReceiver *m_webhook = nullptr;
	StatusHub *m_hub = nullptr;
	std::unique_ptr<QHttpServer> m_server;
	QTcpServer *m_tcp_server = nullptr;
};

bool parse_bool_param(const QString &value);

} // namespace cs

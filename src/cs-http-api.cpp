#include "cs-http-api.hpp"

#include "cs-log.hpp"
#include "cs-processing-queue.hpp"
#include "cs-processing-tracker.hpp"
#include "cs-status-hub.hpp"
#include "cs-summary-store.hpp"
#include "cs-trigger-coordinator.hpp"
#include "cs-webhook-receiver.hpp"

#include <QHostAddress>
#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QTcpServer>
#include <QUrlQuery>

namespace cs {
namespace {

using Method = QHttpServerRequest::Method;
using StatusCode = QHttpServerResponse::StatusCode;

ApiResponse error_response(int status_code, const QString &detail)
{
	ApiResponse response;
	response.status_code = status_code;
	response.body.insert("detail", detail);
	return response;
}

QHttpServerResponse to_http(const ApiResponse &response)
{
	return QHttpServerResponse(response.body, static_cast<StatusCode>(response.status_code));
}

QByteArray header_value(const QHttpServerRequest &request, const char *name)
{
	return request.headers().value(name).toByteArray();
}

} // namespace

bool parse_bool_param(const QString &value)
{
	const QString lowered = value.trimmed().toLower();
	return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

HttpApi::HttpApi(const HttpConfig &config, ProcessingQueue *queue, TriggerCoordinator *coordinator,
		 ProcessingTracker *tracker, WebhookReceiver *webhook, StatusHub *hub)
	: m_config(config),
	  m_queue(queue),
	  m_coordinator(coordinator),
	  m_tracker(tracker),
	  m_webhook(webhook),
	  m_hub(hub)
{
}

HttpApi::~HttpApi()
{
	close();
}

bool HttpApi::listen(QString *error)
{
	if (!m_server) {
		m_server = std::make_unique<QHttpServer>();
		register_routes();
	}

	auto tcp_server = std::make_unique<QTcpServer>();
	const QHostAddress address = m_config.host == "0.0.0.0" ? QHostAddress(QHostAddress::Any)
							       : QHostAddress(m_config.host);
	if (!tcp_server->listen(address, static_cast<quint16>(m_config.port))) {
		if (error)
			*error = QString("Failed to listen on %1:%2: %3")
					 .arg(m_config.host)
					 .arg(m_config.port)
					 .arg(tcp_server->errorString());
		return false;
	}
	if (!m_server->bind(tcp_server.get())) {
		if (error)
			*error = "Failed to bind HTTP server";
		return false;
	}
	m_tcp_server = tcp_server.release();
	qCInfo(cs_log, "[http] listening on %s:%u", qUtf8Printable(m_config.host),
	       static_cast<unsigned>(m_tcp_server->serverPort()));
	return true;
}

void HttpApi::close()
{
	if (m_tcp_server)
		m_tcp_server->close();
	m_server.reset();
	m_tcp_server = nullptr;
}

quint16 HttpApi::port() const
{
	return m_tcp_server ? m_tcp_server->serverPort() : 0;
}

bool HttpApi::authorized(const QByteArray &authorization_header) const
{
	if (m_config.api_token.isEmpty())
		return true;
	const QByteArray expected = "Bearer " + m_config.api_token.toUtf8();
	return authorization_header == expected;
}

ApiResponse HttpApi::handle_process(const QString &call_id, bool force, const QString &recording_ref)
{
	if (call_id.trimmed().isEmpty())
		return error_response(400, "call_id is required");

	ApiResponse response;
	const ProcessDecision decision = m_coordinator->should_process(call_id, force);
	if (decision == ProcessDecision::AlreadySummarized) {
		response.body.insert("status", process_decision_to_key(decision));
		response.body.insert("call_id", call_id);
		const std::optional<SummaryRecord> summary = m_coordinator->store()->find(call_id);
		if (summary)
			response.body.insert("summary", summary_record_to_json(*summary));
		return response;
	}
	if (decision == ProcessDecision::InFlight && !m_queue->find_active(call_id)) {
		response.body.insert("status", process_decision_to_key(decision));
		response.body.insert("call_id", call_id);
		response.body.insert("message", "Call is already being processed");
		return response;
	}

	const AddResult added = m_queue->add(call_id, recording_ref, force);
	response.body = add_result_to_json(added);
	response.body.insert("call_id", call_id);
	return response;
}

ApiResponse HttpApi::handle_batch(const QByteArray &body)
{
	QJsonParseError parse_error;
	const QJsonDocument doc = QJsonDocument::fromJson(body, &parse_error);
	if (parse_error.error != QJsonParseError::NoError || !doc.isObject())
		return error_response(400, "Request body must be a JSON object");

	const QJsonValue items_value = doc.object().value("items");
	if (!items_value.isArray())
		return error_response(400, "items must be an array");

	QVector<QueueJob> jobs;
	for (const QJsonValue &value : items_value.toArray()) {
		const QJsonObject item = value.toObject();
		QueueJob job;
		job.call_id = item.value("call_id").toString().trimmed();
		if (job.call_id.isEmpty())
			return error_response(400, "Every item needs a call_id");
		job.recording_ref = item.value("recording_file").toString();
		job.force = item.value("force").toBool(false);
		jobs.push_back(job);
	}

	ApiResponse response;
	response.body = batch_result_to_json(m_queue->add_batch(jobs));
	return response;
}

ApiResponse HttpApi::handle_status() const
{
	ApiResponse response;
	response.body = queue_status_to_json(m_queue->get_status());
	return response;
}

ApiResponse HttpApi::handle_clear()
{
	ApiResponse response;
	response.body = clear_result_to_json(m_queue->clear());
	response.body.insert("status", "cleared");
	return response;
}

ApiResponse HttpApi::handle_summary(const QString &call_id)
{
	QString error;
	const std::optional<SummaryRecord> summary = m_coordinator->store()->find(call_id, &error);
	if (!error.isEmpty())
		return error_response(500, error);
	if (!summary)
		return error_response(404, "Summary not found");

	ApiResponse response;
	response.body = summary_record_to_json(*summary);
	return response;
}

ApiResponse HttpApi::handle_health() const
{
	ApiResponse response;
	response.body.insert("status", "ok");
	response.body.insert("queue_running", m_queue->is_running());
	response.body.insert("active_processing", m_tracker->active_count());
	if (m_hub)
		response.body.insert("status_clients", m_hub->client_count());
	return response;
}

ApiResponse HttpApi::handle_webhook(const QByteArray &body, const QString &provided_token, bool force_new_cdr)
{
	if (!m_webhook)
		return error_response(404, "Webhook receiver is disabled");

	QJsonParseError parse_error;
	const QJsonDocument doc = QJsonDocument::fromJson(body, &parse_error);
	if (parse_error.error != QJsonParseError::NoError || !doc.isObject())
		return error_response(400, "Request body must be a JSON object");

	QJsonObject event = doc.object();
	if (force_new_cdr)
		event.insert("event", "NewCdr");

	const WebhookStatus status = m_webhook->handle_event(event, provided_token);
	ApiResponse response;
	response.body.insert("status", webhook_status_to_key(status));
	if (status == WebhookStatus::Unauthorized) {
		response.status_code = 401;
		response.body.insert("message", "Invalid token");
	}
	return response;
}

void HttpApi::register_routes()
{
	const auto guarded = [this](const QHttpServerRequest &request, const std::function<ApiResponse()> &handler) {
		if (!authorized(header_value(request, "Authorization")))
			return to_http(error_response(401, "Not authenticated"));
		return to_http(handler());
	};

	m_server->route("/health", Method::Get, [this]() { return to_http(handle_health()); });

	m_server->route("/api/queue/process/<arg>", Method::Post,
			[this, guarded](const QString &call_id, const QHttpServerRequest &request) {
				const QUrlQuery query = request.query();
				const bool force = parse_bool_param(query.queryItemValue("force"));
				const QString recording = query.queryItemValue("recording", QUrl::FullyDecoded);
				return guarded(request,
					       [&]() { return handle_process(call_id, force, recording); });
			});

	m_server->route("/api/queue/batch", Method::Post, [this, guarded](const QHttpServerRequest &request) {
		return guarded(request, [&]() { return handle_batch(request.body()); });
	});

	m_server->route("/api/queue/status", Method::Get, [this, guarded](const QHttpServerRequest &request) {
		return guarded(request, [&]() { return handle_status(); });
	});

	m_server->route("/api/queue/clear", Method::Post, [this, guarded](const QHttpServerRequest &request) {
		return guarded(request, [&]() { return handle_clear(); });
	});

	m_server->route("/api/summaries/<arg>", Method::Get,
			[this, guarded](const QString &call_id, const QHttpServerRequest &request) {
				return guarded(request, [&]() { return handle_summary(call_id); });
			});

	// The PBX authenticates with the webhook token instead of the API token.
	const auto webhook_token = [](const QHttpServerRequest &request) {
		const QString header = QString::fromUtf8(header_value(request, "X-Webhook-Token"));
		return header.isEmpty() ? request.query().queryItemValue("token") : header;
	};
	m_server->route("/api/webhook/event", Method::Post, [this, webhook_token](const QHttpServerRequest &request) {
		return to_http(handle_webhook(request.body(), webhook_token(request), false));
	});
	m_server->route("/api/webhook/cdr", Method::Post, [this, webhook_token](const QHttpServerRequest &request) {
		return to_http(handle_webhook(request.body(), webhook_token(request), true));
	});
}

} // namespace cs

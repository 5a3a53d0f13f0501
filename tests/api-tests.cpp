#include "cs-http-api.hpp"
#include "cs-http-client.hpp"
#include "cs-processing-queue.hpp"
#include "cs-processing-tracker.hpp"
#include "cs-recording-processor.hpp"
#include "cs-status-hub.hpp"
#include "cs-summary-store.hpp"
#include "cs-trigger-coordinator.hpp"
#include "cs-webhook-receiver.hpp"
#include "test-support.hpp"

#include <QJsonDocument>
#include <QNetworkRequest>
#include <QTemporaryDir>
#include <QWebSocket>

#include <cstdlib>
#include <iostream>
#include <memory>

using cs_test::wait_until;

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "API test failed: " << message << std::endl;
	std::exit(1);
}

QByteArray to_json(const QJsonObject &obj)
{
	return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

// Queue is left stopped so queued calls stay visible.
struct ApiFixture {
	QTemporaryDir temp_dir;
	cs_test::FakePbxClient pbx;
	cs_test::FakeAnalysisBackend backend;
	std::unique_ptr<cs::SummaryStore> store;
	std::unique_ptr<cs::RecordingProcessor> processor;
	cs::ProcessingTracker tracker;
	std::unique_ptr<cs::TriggerCoordinator> coordinator;
	std::unique_ptr<cs::ProcessingQueue> queue;
	std::unique_ptr<cs::WebhookReceiver> webhook;
	std::unique_ptr<cs::HttpApi> api;

	ApiFixture()
	{
		require(temp_dir.isValid(), "temporary directory created");
		pbx.audio_path = cs_test::write_fake_audio(temp_dir.path());
		store = std::make_unique<cs::SummaryStore>(temp_dir.filePath("summaries.db"));
		QString error;
		require(store->open(&error), "store opens");
		processor = std::make_unique<cs::RecordingProcessor>(&pbx, &backend, store.get(), cs::ProcessorOptions());
		coordinator = std::make_unique<cs::TriggerCoordinator>(&tracker, store.get(), processor.get());
		queue = std::make_unique<cs::ProcessingQueue>(cs::QueueOptions());
		queue->set_process_function(coordinator->queue_process_function(queue.get()));

		cs::TriggerConfig triggers;
		triggers.auto_process_calls = false;
		triggers.webhook_token = "hook-secret";
		webhook = std::make_unique<cs::WebhookReceiver>(coordinator.get(), triggers);

		cs::HttpConfig http;
		http.host = "127.0.0.1";
		http.port = 0;
		http.api_token = "api-secret";
		api = std::make_unique<cs::HttpApi>(http, queue.get(), coordinator.get(), &tracker, webhook.get());
	}

	void mark_summarized(const QString &call_id)
	{
		cs::SummaryRecord record;
		record.call_id = call_id;
		record.summary = "Customer confirmed the appointment.";
		record.sentiment = "positive";
		QString error;
		require(store->upsert_summary(record, &error), "seed summary stored");
	}
};

void test_bearer_authorization()
{
	ApiFixture fixture;
	require(fixture.api->authorized("Bearer api-secret"), "matching bearer token accepted");
	require(!fixture.api->authorized("Bearer nope"), "wrong token rejected");
	require(!fixture.api->authorized("api-secret"), "token without scheme rejected");
	require(!fixture.api->authorized(QByteArray()), "missing header rejected");

	cs::HttpApi open_api(cs::HttpConfig(), fixture.queue.get(), fixture.coordinator.get(), &fixture.tracker, nullptr);
	require(open_api.authorized(QByteArray()), "no configured token leaves the API open");

	require(cs::parse_bool_param("true") && cs::parse_bool_param("1") && cs::parse_bool_param(" Yes "),
		"truthy flags parsed");
	require(!cs::parse_bool_param("false") && !cs::parse_bool_param(QString()), "falsy flags parsed");
}

void test_process_request_decisions()
{
	ApiFixture fixture;
	require(fixture.api->handle_process(" ", false, QString()).status_code == 400, "blank call id rejected");

	cs::ApiResponse queued = fixture.api->handle_process("p1", false, "p1.wav");
	require(queued.status_code == 200, "queued request succeeds");
	require(queued.body.value("status").toString() == "queued", "new call queued");
	require(queued.body.value("position").toInt() == 1, "position reported");
	require(queued.body.value("call_id").toString() == "p1", "call id echoed");

	cs::ApiResponse again = fixture.api->handle_process("p1", false, "p1.wav");
	require(again.body.value("status").toString() == "already_queued", "duplicate request reports existing item");

	fixture.mark_summarized("p2");
	cs::ApiResponse done = fixture.api->handle_process("p2", false, QString());
	require(done.body.value("status").toString() == "already_processed", "summarized call not queued");
	require(done.body.value("summary").toObject().value("summary").toString() ==
			"Customer confirmed the appointment.",
		"existing summary returned");

	cs::ApiResponse forced = fixture.api->handle_process("p2", true, QString());
	require(forced.body.value("status").toString() == "queued", "force queues a summarized call");

	require(fixture.tracker.try_acquire("p3"), "background trigger holds p3");
	cs::ApiResponse busy = fixture.api->handle_process("p3", false, QString());
	require(busy.body.value("status").toString() == "processing", "call held outside the queue reported");
	fixture.tracker.release("p3");

	require(fixture.queue->get_status().pending_items.size() == 2, "only p1 and forced p2 pending");
}

void test_batch_and_clear()
{
	ApiFixture fixture;
	require(fixture.api->handle_batch("not json").status_code == 400, "malformed body rejected");
	require(fixture.api->handle_batch("{\"items\": {}}").status_code == 400, "items must be an array");
	require(fixture.api->handle_batch("{\"items\": [{\"recording_file\": \"x.wav\"}]}").status_code == 400,
		"item without call id rejected");
	require(fixture.queue->get_status().pending_items.isEmpty(), "rejected batch queues nothing");

	fixture.api->handle_process("b1", false, QString());
	const cs::ApiResponse batch = fixture.api->handle_batch(
		"{\"items\": [{\"call_id\": \"b1\"}, {\"call_id\": \"b2\", \"recording_file\": \"b2.wav\"}, "
		"{\"call_id\": \"b3\", \"force\": true}]}");
	require(batch.status_code == 200, "batch accepted");
	require(batch.body.value("added_count").toInt() == 2, "new calls added");
	require(batch.body.value("skipped").toArray().first().toString() == "b1", "queued call skipped");

	const cs::ApiResponse status = fixture.api->handle_status();
	require(status.body.value("pending").toInt() == 3, "status lists pending calls");
	require(!status.body.value("is_running").toBool(), "queue reported stopped");

	const cs::ApiResponse cleared = fixture.api->handle_clear();
	require(cleared.body.value("status").toString() == "cleared", "clear acknowledged");
	require(cleared.body.value("cleared_count").toInt() == 3, "pending calls removed");
	require(fixture.api->handle_status().body.value("pending").toInt() == 0, "queue empty after clear");
}

void test_summary_and_health()
{
	ApiFixture fixture;
	require(fixture.api->handle_summary("missing").status_code == 404, "unknown summary is 404");

	fixture.mark_summarized("s1");
	const cs::ApiResponse found = fixture.api->handle_summary("s1");
	require(found.status_code == 200, "stored summary served");
	require(found.body.value("sentiment").toString() == "positive", "summary fields serialized");

	require(fixture.tracker.try_acquire("s2"), "hold one call");
	const cs::ApiResponse health = fixture.api->handle_health();
	require(health.body.value("status").toString() == "ok", "health ok");
	require(health.body.value("active_processing").toInt() == 1, "active processing counted");
	require(!health.body.contains("status_clients"), "no hub, no client count");
	fixture.tracker.release("s2");
}

void test_webhook_requests()
{
	ApiFixture fixture;
	QJsonObject event;
	event.insert("event", "CallStatus");

	const cs::ApiResponse denied = fixture.api->handle_webhook(to_json(event), "bad", false);
	require(denied.status_code == 401, "bad webhook token is 401");
	require(denied.body.value("status").toString() == "error", "bad token status");

	require(fixture.api->handle_webhook("[]", "hook-secret", false).status_code == 400, "non-object body rejected");

	const cs::ApiResponse received = fixture.api->handle_webhook(to_json(event), "hook-secret", false);
	require(received.body.value("status").toString() == "received", "event acknowledged");

	const cs::ApiResponse cdr =
		fixture.api->handle_webhook(to_json(cs_test::cdr_record("h1", "Inbound", "ANSWERED", "h1.wav")),
					    "hook-secret", true);
	require(cdr.body.value("status").toString() == "received", "CDR route acknowledges with auto processing off");

	cs::HttpApi no_webhook(cs::HttpConfig(), fixture.queue.get(), fixture.coordinator.get(), &fixture.tracker,
			       nullptr);
	require(no_webhook.handle_webhook(to_json(event), QString(), false).status_code == 404,
		"webhook disabled is 404");
}

void test_routes_over_http()
{
	ApiFixture fixture;
	QString error;
	require(fixture.api->listen(&error), "api listens");
	require(fixture.api->port() != 0, "ephemeral port assigned");
	const QString base = QString("http://127.0.0.1:%1").arg(fixture.api->port());

	cs::HttpReply reply;
	require(cs::http_get(QNetworkRequest(QUrl(base + "/health")), 5000, &reply, &error), "health served");
	QJsonObject body;
	require(cs::parse_json_object(reply.body, &body, &error) && body.value("status").toString() == "ok",
		"health body");

	require(!cs::http_get(QNetworkRequest(QUrl(base + "/api/queue/status")), 5000, &reply, &error),
		"status without token fails");
	require(reply.status_code == 401, "missing bearer token is 401");

	QNetworkRequest authed(QUrl(base + "/api/queue/process/r1?recording=r1%2B1.wav"));
	authed.setRawHeader("Authorization", "Bearer api-secret");
	authed.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
	require(cs::http_post(authed, QByteArray(), 5000, &reply, &error), "process route served");
	require(cs::parse_json_object(reply.body, &body, &error) && body.value("status").toString() == "queued",
		"process route queues");
	require(fixture.queue->find_active("r1")->recording_ref == "r1+1.wav", "recording query decoded");

	QNetworkRequest hook(QUrl(base + "/api/webhook/event?token=hook-secret"));
	hook.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
	require(cs::http_post(hook, "{\"event\": \"CallStatus\"}", 5000, &reply, &error),
		"webhook route authenticates by token query");

	fixture.api->close();
	require(fixture.api->port() == 0, "closed api has no port");
}

void test_status_hub_fan_out()
{
	cs::StatusHub hub;
	QString error;
	require(hub.listen("127.0.0.1", 0, &error), "hub listens");

	QWebSocket client;
	QStringList messages;
	QObject::connect(&client, &QWebSocket::textMessageReceived,
			 [&messages](const QString &message) { messages.push_back(message); });
	client.open(QUrl(QString("ws://127.0.0.1:%1").arg(hub.port())));
	require(wait_until([&]() { return hub.client_count() == 1; }), "client registered");

	client.sendTextMessage("ping");
	require(wait_until([&]() { return messages.contains("pong"); }), "ping answered");

	QJsonObject status;
	status.insert("type", "queue_status");
	hub.broadcast(status);
	require(wait_until([&]() { return messages.size() >= 2; }), "broadcast delivered");
	require(QJsonDocument::fromJson(messages.at(1).toUtf8()).object().value("type").toString() == "queue_status",
		"broadcast payload");

	QJsonObject summary;
	summary.insert("call_id", "hub-1");
	hub.publish_summary(summary);
	require(wait_until([&]() { return messages.size() >= 4; }), "summary notifications delivered");
	const QJsonObject processed = QJsonDocument::fromJson(messages.at(2).toUtf8()).object();
	require(processed.value("type").toString() == "summary_processed" &&
			processed.value("call_id").toString() == "hub-1",
		"summary notification first");
	require(QJsonDocument::fromJson(messages.at(3).toUtf8()).object().value("type").toString() ==
			"analytics_update",
		"analytics update second");

	client.close();
	require(wait_until([&]() { return hub.client_count() == 0; }), "closed client dropped");
	hub.close();
}

} // namespace

void run_api_tests()
{
	test_bearer_authorization();
	test_process_request_decisions();
	test_batch_and_clear();
	test_summary_and_health();
	test_webhook_requests();
	test_routes_over_http();
	test_status_hub_fan_out();
}

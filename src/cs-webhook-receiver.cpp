#include "cs-webhook-receiver.hpp"

#include "cs-cdr-filter.hpp"
#include "cs-log.hpp"
#include "cs-trigger-coordinator.hpp"

#include <QTimer>

namespace cs {

const char *webhook_status_to_key(WebhookStatus status)
{
	switch (status) {
	case WebhookStatus::Scheduled:
		return "scheduled";
	case WebhookStatus::Ignored:
		return "ignored";
	case WebhookStatus::Unauthorized:
		return "error";
	case WebhookStatus::Received:
	default:
		return "received";
	}
}

WebhookReceiver::WebhookReceiver(TriggerCoordinator *coordinator, const TriggerConfig &config, QObject *parent)
	: QObject(parent),
	  m_coordinator(coordinator),
	  m_config(config)
{
	m_pool.setObjectName("webhook-runs");
}

WebhookReceiver::~WebhookReceiver()
{
	shutdown();
}

bool WebhookReceiver::token_valid(const QString &provided_token) const
{
	if (m_config.webhook_token.isEmpty())
		return true;
	return provided_token == m_config.webhook_token;
}

WebhookStatus WebhookReceiver::handle_event(const QJsonObject &event, const QString &provided_token)
{
	if (!token_valid(provided_token)) {
		qCWarning(cs_log, "[webhook] invalid webhook token received");
		return WebhookStatus::Unauthorized;
	}

	QString event_type = event.value("event").toString();
	if (event_type.isEmpty())
		event_type = event.value("action").toString();
	if (event_type.isEmpty()) {
		qCWarning(cs_log, "[webhook] event without a type ignored");
		return WebhookStatus::Ignored;
	}
	if (event_type != "NewCdr") {
		qCDebug(cs_log, "[webhook] %s event received", qUtf8Printable(event_type));
		return WebhookStatus::Received;
	}

	if (!m_config.auto_process_calls)
		return WebhookStatus::Received;

	CdrCandidate candidate;
	QString reason;
	if (!cdr_candidate(event, m_config.process_internal_calls, &candidate, &reason)) {
		qCInfo(cs_log, "[webhook] not auto-processing CDR: %s", qUtf8Printable(reason));
		return WebhookStatus::Received;
	}

	if (m_coordinator->should_process(candidate.call_id, false) != ProcessDecision::Process) {
		qCInfo(cs_log, "[webhook] skipping %s, already summarized or in flight", qUtf8Printable(candidate.call_id));
		return WebhookStatus::Received;
	}

	schedule_run(candidate.call_id, candidate.recording_ref);
	return WebhookStatus::Scheduled;
}

void WebhookReceiver::shutdown()
{
	m_shutting_down = true;
	m_pool.waitForDone();
}

void WebhookReceiver::schedule_run(const QString &call_id, const QString &recording_ref)
{
	qCInfo(cs_log, "[webhook] scheduling %s for processing in %d ms", qUtf8Printable(call_id),
	       m_config.webhook_settle_delay_ms);

	QueueJob job;
	job.call_id = call_id;
	job.recording_ref = recording_ref;
	QTimer::singleShot(m_config.webhook_settle_delay_ms, this, [this, job]() {
		if (m_shutting_down)
			return;
		TriggerCoordinator *coordinator = m_coordinator;
		m_pool.start([coordinator, job]() { coordinator->run_direct(job, "webhook"); });
	});
}

} // namespace cs

#pragma once

#include "cs-config.hpp"

#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QThreadPool>

namespace cs {

class TriggerCoordinator;

enum class WebhookStatus {
	Received,
	Scheduled,
	Ignored,
	Unauthorized,
};

const char *webhook_status_to_key(WebhookStatus status);

// Push trigger. A NewCdr event for an eligible call schedules a direct,
// guarded pipeline run after a settle delay, so the PBX has finished writing
// the recording.
class WebhookReceiver : public QObject {
public:
	WebhookReceiver(TriggerCoordinator *coordinator, const TriggerConfig &config, QObject *parent = nullptr);
	~WebhookReceiver() override;

	bool token_valid(const QString &provided_token) const;

	WebhookStatus handle_event(const QJsonObject &event, const QString &provided_token);

	// Blocks until every scheduled run has finished.
	void shutdown();

private:
	void schedule_run(const QString &call_id, const QString &recording_ref);

	TriggerCoordinator *m_coordinator = nullptr;
	TriggerConfig m_config;
	QThreadPool m_pool;
	bool m_shutting_down = false;
};

} // namespace cs

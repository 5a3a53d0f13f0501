#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include <algorithm>
#include <limits>

namespace cs {

enum class QueueItemStatus {
	Pending,
	Processing,
	Completed,
	Failed,
	Retrying,
};

enum class ProcessingStage {
	None,
	Downloading,
	Transcribing,
	Analyzing,
	Saving,
};

struct QueueJob {
	QString call_id;
	QString recording_ref;
	bool force = false;
};

struct QueueItem {
	QString call_id;
	QString recording_ref;
	bool force = false;
	QueueItemStatus status = QueueItemStatus::Pending;
	int attempt = 0;
	int max_retries = 3;
	QString error_message;
	qint64 enqueued_at_ms = 0;
	qint64 started_at_ms = 0;
	qint64 completed_at_ms = 0;
	qint64 next_retry_at_ms = 0;
	ProcessingStage stage = ProcessingStage::None;

	bool is_active() const
	{
		return status == QueueItemStatus::Pending || status == QueueItemStatus::Processing ||
		       status == QueueItemStatus::Retrying;
	}
	bool is_waiting() const { return status == QueueItemStatus::Pending || status == QueueItemStatus::Retrying; }
};

const char *queue_item_status_to_key(QueueItemStatus status);

const char *processing_stage_to_key(ProcessingStage stage);

QJsonObject queue_item_to_json(const QueueItem &item);

// Delay before the retry that follows the given (1-based) attempt: base * 2^attempt,
// capped at the longest interval a QTimer accepts.
inline qint64 retry_backoff_ms(int attempt, int base_delay_ms)
{
	if (attempt < 0)
		attempt = 0;
	if (attempt > 20)
		attempt = 20;
	if (base_delay_ms < 0)
		base_delay_ms = 0;
	const qint64 delay = static_cast<qint64>(base_delay_ms) << attempt;
	return std::min<qint64>(delay, std::numeric_limits<int>::max());
}

} // namespace cs

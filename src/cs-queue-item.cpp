#include "cs-queue-item.hpp"

#include <QJsonValue>

namespace cs {
namespace {

QJsonValue seconds_or_null(qint64 unix_ms)
{
	if (unix_ms <= 0)
		return QJsonValue(QJsonValue::Null);
	return QJsonValue(static_cast<double>(unix_ms) / 1000.0);
}

QJsonValue string_or_null(const QString &value)
{
	if (value.isEmpty())
		return QJsonValue(QJsonValue::Null);
	return QJsonValue(value);
}

} // namespace

const char *queue_item_status_to_key(QueueItemStatus status)
{
	switch (status) {
	case QueueItemStatus::Pending:
		return "pending";
	case QueueItemStatus::Processing:
		return "processing";
	case QueueItemStatus::Completed:
		return "completed";
	case QueueItemStatus::Failed:
		return "failed";
	case QueueItemStatus::Retrying:
		return "retrying";
	default:
		return "pending";
	}
}

const char *processing_stage_to_key(ProcessingStage stage)
{
	switch (stage) {
	case ProcessingStage::Downloading:
		return "downloading";
	case ProcessingStage::Transcribing:
		return "transcribing";
	case ProcessingStage::Analyzing:
		return "analyzing";
	case ProcessingStage::Saving:
		return "saving";
	case ProcessingStage::None:
	default:
		return "";
	}
}

QJsonObject queue_item_to_json(const QueueItem &item)
{
	QJsonObject json_obj;
	json_obj.insert("call_id", item.call_id);
	json_obj.insert("recording_file", string_or_null(item.recording_ref));
	json_obj.insert("force", item.force);
	json_obj.insert("status", queue_item_status_to_key(item.status));
	json_obj.insert("attempt", item.attempt);
	json_obj.insert("max_retries", item.max_retries);
	json_obj.insert("error_message", string_or_null(item.error_message));
	json_obj.insert("added_at", seconds_or_null(item.enqueued_at_ms));
	json_obj.insert("started_at", seconds_or_null(item.started_at_ms));
	json_obj.insert("completed_at", seconds_or_null(item.completed_at_ms));
	json_obj.insert("next_retry_at", seconds_or_null(item.next_retry_at_ms));
	json_obj.insert("stage", string_or_null(QString::fromLatin1(processing_stage_to_key(item.stage))));
	return json_obj;
}

} // namespace cs

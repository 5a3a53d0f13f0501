#include "cs-processing-queue.hpp"

#include "cs-log.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QThread>
#include <QtConcurrent>

#include <algorithm>
#include <exception>
#include <limits>

namespace cs {
namespace {

qint64 now_ms()
{
	return QDateTime::currentMSecsSinceEpoch();
}

QJsonArray items_to_json(const QVector<QueueItem> &items)
{
	QJsonArray array;
	for (const QueueItem &item : items)
		array.push_back(queue_item_to_json(item));
	return array;
}

} // namespace

const char *add_status_to_key(AddStatus status)
{
	switch (status) {
	case AddStatus::AlreadyQueued:
		return "already_queued";
	case AddStatus::Queued:
	default:
		return "queued";
	}
}

QJsonObject add_result_to_json(const AddResult &result)
{
	QJsonObject json_obj;
	json_obj.insert("status", add_status_to_key(result.status));
	json_obj.insert("position", result.position);
	json_obj.insert("item", queue_item_to_json(result.item));
	return json_obj;
}

QJsonObject batch_result_to_json(const BatchResult &result)
{
	QJsonObject json_obj;
	json_obj.insert("status", "batch_queued");
	json_obj.insert("added_count", static_cast<int>(result.added.size()));
	json_obj.insert("skipped_count", static_cast<int>(result.skipped.size()));
	json_obj.insert("added", QJsonArray::fromStringList(result.added));
	json_obj.insert("skipped", QJsonArray::fromStringList(result.skipped));
	return json_obj;
}

QJsonObject clear_result_to_json(const ClearResult &result)
{
	QJsonObject json_obj;
	json_obj.insert("cleared_count", static_cast<int>(result.call_ids.size()));
	json_obj.insert("call_ids", QJsonArray::fromStringList(result.call_ids));
	return json_obj;
}

QJsonObject queue_status_to_json(const QueueStatus &status)
{
	QJsonObject json_obj;
	json_obj.insert("pending", static_cast<int>(status.pending_items.size()));
	json_obj.insert("pending_items", items_to_json(status.pending_items));
	json_obj.insert("processing_item", status.processing_item ? QJsonValue(queue_item_to_json(*status.processing_item))
								  : QJsonValue(QJsonValue::Null));
	json_obj.insert("completed_count", static_cast<int>(status.recent_completed.size()));
	json_obj.insert("failed_count", static_cast<int>(status.recent_failed.size()));
	json_obj.insert("recent_completed", items_to_json(status.recent_completed));
	json_obj.insert("recent_failed", items_to_json(status.recent_failed));
	json_obj.insert("is_running", status.is_running);
	return json_obj;
}

ProcessingQueue::ProcessingQueue(const QueueOptions &options, QObject *parent) : QObject(parent), m_options(options)
{
	if (m_options.max_retries < 1)
		m_options.max_retries = 1;
	if (m_options.history_limit < 1)
		m_options.history_limit = 1;

	// One consumer: the process function never runs twice at the same time.
	m_pool.setMaxThreadCount(1);

	m_retry_timer.setSingleShot(true);
	connect(&m_retry_timer, &QTimer::timeout, this, [this]() { on_retry_due(); });
	connect(&m_watcher, &QFutureWatcher<ProcessOutcome>::finished, this, [this]() { on_item_finished(); });
}

ProcessingQueue::~ProcessingQueue()
{
	m_running = false;
	m_retry_timer.stop();
	m_watcher.disconnect(this);
	m_watcher.waitForFinished();
	m_pool.waitForDone();
}

void ProcessingQueue::set_process_function(ProcessFunction fn)
{
	m_process_fn = std::move(fn);
}

void ProcessingQueue::set_broadcast_function(BroadcastFunction fn)
{
	m_broadcast_fn = std::move(fn);
}

void ProcessingQueue::start()
{
	if (m_running)
		return;
	m_running = true;
	qCInfo(cs_log, "[queue] worker started");
	schedule_dispatch();
}

void ProcessingQueue::stop()
{
	if (!m_running)
		return;
	m_running = false;
	m_retry_timer.stop();
	if (m_waiting) {
		// Back to the head so a restart resumes with the same item.
		m_pending.prepend(m_waiting);
		m_waiting.reset();
	}
	qCInfo(cs_log, "[queue] worker stopped");
}

bool ProcessingQueue::is_running() const
{
	return m_running;
}

AddResult ProcessingQueue::add(const QString &call_id, const QString &recording_ref, bool force)
{
	AddResult result;
	const ItemPtr existing = m_items.value(call_id);
	if (existing && existing->is_active()) {
		result.status = AddStatus::AlreadyQueued;
		result.position = position_of(call_id);
		result.item = *existing;
		qCDebug(cs_log, "[queue] %s already queued (status=%s)", qUtf8Printable(call_id),
			queue_item_status_to_key(existing->status));
		return result;
	}

	auto item = std::make_shared<QueueItem>();
	item->call_id = call_id;
	item->recording_ref = recording_ref;
	item->force = force;
	item->max_retries = m_options.max_retries;
	item->enqueued_at_ms = now_ms();
	m_items.insert(call_id, item);
	m_pending.enqueue(item);

	result.status = AddStatus::Queued;
	result.position = position_of(call_id);
	result.item = *item;
	qCInfo(cs_log, "[queue] queued %s at position %d", qUtf8Printable(call_id), result.position);

	broadcast_status();
	schedule_dispatch();
	return result;
}

BatchResult ProcessingQueue::add_batch(const QVector<QueueJob> &jobs)
{
	BatchResult result;
	for (const QueueJob &job : jobs) {
		const AddResult added = add(job.call_id, job.recording_ref, job.force);
		if (added.status == AddStatus::Queued)
			result.added.push_back(job.call_id);
		else
			result.skipped.push_back(job.call_id);
	}
	return result;
}

ClearResult ProcessingQueue::clear()
{
	ClearResult result;

	QQueue<ItemPtr> kept;
	for (const ItemPtr &item : m_pending) {
		if (item->is_waiting()) {
			if (is_indexed(item)) {
				result.call_ids.push_back(item->call_id);
				m_items.remove(item->call_id);
			}
			continue;
		}
		kept.enqueue(item);
	}
	m_pending = kept;

	if (m_waiting) {
		m_retry_timer.stop();
		if (is_indexed(m_waiting)) {
			result.call_ids.prepend(m_waiting->call_id);
			m_items.remove(m_waiting->call_id);
		}
		m_waiting.reset();
	}

	qCInfo(cs_log, "[queue] cleared %lld pending items", static_cast<long long>(result.call_ids.size()));
	broadcast_status();
	schedule_dispatch();
	return result;
}

void ProcessingQueue::update_stage(const QString &call_id, ProcessingStage stage)
{
	if (QThread::currentThread() != thread()) {
		QMetaObject::invokeMethod(
			this, [this, call_id, stage]() { apply_stage(call_id, stage); }, Qt::QueuedConnection);
		return;
	}
	apply_stage(call_id, stage);
}

QueueStatus ProcessingQueue::get_status() const
{
	QueueStatus status;
	for (const ItemPtr &item : waiting_items())
		status.pending_items.push_back(*item);
	if (m_current)
		status.processing_item = *m_current;
	status.recent_completed = m_completed;
	status.recent_failed = m_failed;
	status.is_running = m_running;
	return status;
}

std::optional<QueueItem> ProcessingQueue::find_active(const QString &call_id) const
{
	const ItemPtr item = m_items.value(call_id);
	if (!item || !item->is_active())
		return std::nullopt;
	return *item;
}

void ProcessingQueue::schedule_dispatch(int delay_ms)
{
	if (m_dispatch_scheduled)
		return;
	m_dispatch_scheduled = true;
	QTimer::singleShot(delay_ms, this, [this]() {
		m_dispatch_scheduled = false;
		dispatch_next();
	});
}

void ProcessingQueue::dispatch_next()
{
	if (!m_running || m_current || m_waiting)
		return;

	try {
		while (!m_pending.isEmpty()) {
			const ItemPtr item = m_pending.dequeue();
			if (!is_indexed(item))
				continue;

			if (item->next_retry_at_ms > 0) {
				const qint64 wait_ms = item->next_retry_at_ms - now_ms();
				if (wait_ms > 0) {
					qCInfo(cs_log, "[queue] waiting %.1fs before retry for %s", wait_ms / 1000.0,
					       qUtf8Printable(item->call_id));
					m_waiting = item;
					const qint64 interval = std::min<qint64>(wait_ms, std::numeric_limits<int>::max());
					m_retry_timer.start(static_cast<int>(interval));
					return;
				}
			}

			begin_item(item);
			return;
		}
	} catch (const std::exception &e) {
		qCCritical(cs_log, "[queue] dispatch error: %s", e.what());
		schedule_dispatch(m_options.dispatch_cooldown_ms);
	}
}

void ProcessingQueue::on_retry_due()
{
	const ItemPtr item = m_waiting;
	m_waiting.reset();
	if (!m_running || !item)
		return;
	if (!is_indexed(item)) {
		schedule_dispatch();
		return;
	}

	try {
		begin_item(item);
	} catch (const std::exception &e) {
		qCCritical(cs_log, "[queue] dispatch error: %s", e.what());
		m_pending.prepend(item);
		schedule_dispatch(m_options.dispatch_cooldown_ms);
	}
}

void ProcessingQueue::begin_item(const ItemPtr &item)
{
	item->status = QueueItemStatus::Processing;
	item->attempt += 1;
	item->started_at_ms = now_ms();
	item->stage = ProcessingStage::None;
	m_current = item;
	qCInfo(cs_log, "[queue] processing %s (attempt %d/%d)", qUtf8Printable(item->call_id), item->attempt,
	       item->max_retries);
	broadcast_status();

	QueueJob job;
	job.call_id = item->call_id;
	job.recording_ref = item->recording_ref;
	job.force = item->force;
	const ProcessFunction fn = m_process_fn;
	m_watcher.setFuture(QtConcurrent::run(&m_pool, [fn, job]() { return run_process_function(fn, job); }));
}

void ProcessingQueue::on_item_finished()
{
	const ItemPtr item = m_current;
	m_current.reset();
	if (!item)
		return;

	const ProcessOutcome outcome = m_watcher.result();
	if (outcome.ok)
		finish_success(item);
	else
		finish_failure(item, outcome.error);

	broadcast_status();
	schedule_dispatch();
}

void ProcessingQueue::finish_success(const ItemPtr &item)
{
	item->status = QueueItemStatus::Completed;
	item->completed_at_ms = now_ms();
	append_history(&m_completed, *item);
	remove_from_index(item);
	qCInfo(cs_log, "[queue] completed %s after %d attempt(s)", qUtf8Printable(item->call_id), item->attempt);
}

void ProcessingQueue::finish_failure(const ItemPtr &item, const QString &error)
{
	item->error_message = error;
	qCWarning(cs_log, "[queue] processing error for %s (attempt %d): %s", qUtf8Printable(item->call_id),
		  item->attempt, qUtf8Printable(error));

	const qint64 now = now_ms();
	const bool residency_exceeded = m_options.max_residency_ms > 0 &&
					now - item->enqueued_at_ms > m_options.max_residency_ms;

	if (item->attempt < item->max_retries && !residency_exceeded) {
		const qint64 backoff_ms = retry_backoff_ms(item->attempt, m_options.retry_base_delay_ms);
		item->status = QueueItemStatus::Retrying;
		item->next_retry_at_ms = now + backoff_ms;
		m_pending.enqueue(item);
		qCInfo(cs_log, "[queue] retrying %s in %.1fs (attempt %d/%d)", qUtf8Printable(item->call_id),
		       backoff_ms / 1000.0, item->attempt + 1, item->max_retries);
		return;
	}

	if (residency_exceeded && item->attempt < item->max_retries)
		item->error_message += " (queue residency limit reached)";
	item->status = QueueItemStatus::Failed;
	item->completed_at_ms = now;
	append_history(&m_failed, *item);
	remove_from_index(item);
	qCWarning(cs_log, "[queue] %s failed permanently: %s", qUtf8Printable(item->call_id),
		  qUtf8Printable(item->error_message));
}

void ProcessingQueue::apply_stage(const QString &call_id, ProcessingStage stage)
{
	if (!m_current || m_current->call_id != call_id)
		return;
	m_current->stage = stage;
	qCDebug(cs_log, "[queue] %s stage=%s", qUtf8Printable(call_id), processing_stage_to_key(stage));
	broadcast_status();
}

void ProcessingQueue::append_history(QVector<QueueItem> *history, const QueueItem &item)
{
	history->push_back(item);
	const int overflow = static_cast<int>(history->size()) - m_options.history_limit;
	if (overflow > 0)
		history->remove(0, overflow);
}

void ProcessingQueue::remove_from_index(const ItemPtr &item)
{
	if (is_indexed(item))
		m_items.remove(item->call_id);
}

bool ProcessingQueue::is_indexed(const ItemPtr &item) const
{
	return item && m_items.value(item->call_id) == item;
}

QVector<ProcessingQueue::ItemPtr> ProcessingQueue::waiting_items() const
{
	QVector<ItemPtr> items;
	if (m_waiting && is_indexed(m_waiting))
		items.push_back(m_waiting);
	for (const ItemPtr &item : m_pending) {
		if (item->is_waiting() && is_indexed(item))
			items.push_back(item);
	}
	return items;
}

int ProcessingQueue::position_of(const QString &call_id) const
{
	int position = 0;
	for (const ItemPtr &item : waiting_items()) {
		++position;
		if (item->call_id == call_id)
			return position;
	}
	return 0;
}

void ProcessingQueue::broadcast_status()
{
	if (!m_broadcast_fn)
		return;

	QJsonObject message = queue_status_to_json(get_status());
	message.insert("type", "queue_status");
	try {
		m_broadcast_fn(message);
	} catch (const std::exception &e) {
		qCWarning(cs_log, "[queue] failed to broadcast queue status: %s", e.what());
	}
}

ProcessOutcome ProcessingQueue::run_process_function(const ProcessFunction &fn, const QueueJob &job)
{
	ProcessOutcome outcome;
	if (!fn) {
		outcome.error = "No process function set";
		return outcome;
	}

	try {
		fn(job);
		outcome.ok = true;
	} catch (const std::exception &e) {
		outcome.error = QString::fromUtf8(e.what());
	} catch (...) {
		outcome.error = "Unknown processing error";
	}
	return outcome;
}

} // namespace cs

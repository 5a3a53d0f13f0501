#pragma once

#include "cs-queue-item.hpp"

#include <QFutureWatcher>
#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QQueue>
#include <QStringList>
#include <QThreadPool>
#include <QTimer>
#include <QVector>

#include <functional>
#include <memory>
#include <optional>

namespace cs {

struct QueueOptions {
	int max_retries = 3;
	int retry_base_delay_ms = 5000;
	int history_limit = 50;
	int dispatch_cooldown_ms = 1000;
	qint64 max_residency_ms = 0;
};

enum class AddStatus {
	Queued,
	AlreadyQueued,
};

struct AddResult {
	AddStatus status = AddStatus::Queued;
	int position = 0;
	QueueItem item;
};

struct BatchResult {
	QStringList added;
	QStringList skipped;
};

struct ClearResult {
	QStringList call_ids;
};

struct QueueStatus {
	QVector<QueueItem> pending_items;
	std::optional<QueueItem> processing_item;
	QVector<QueueItem> recent_completed;
	QVector<QueueItem> recent_failed;
	bool is_running = false;
};

struct ProcessOutcome {
	bool ok = false;
	QString error;
};

const char *add_status_to_key(AddStatus status);
QJsonObject add_result_to_json(const AddResult &result);
QJsonObject batch_result_to_json(const BatchResult &result);
QJsonObject clear_result_to_json(const ClearResult &result);
QJsonObject queue_status_to_json(const QueueStatus &status);

// Single-consumer job queue. Every public method except update_stage() must be
// called on the thread that owns the queue; the process function runs on a
// private one-thread pool and reports back through the owner's event loop.
class ProcessingQueue : public QObject {
public:
	// Throws on a retryable failure; returning normally completes the item.
	using ProcessFunction = std::function<void(const QueueJob &job)>;
	using BroadcastFunction = std::function<void(const QJsonObject &status)>;

	explicit ProcessingQueue(const QueueOptions &options, QObject *parent = nullptr);
	~ProcessingQueue() override;

	void set_process_function(ProcessFunction fn);
	void set_broadcast_function(BroadcastFunction fn);

	void start();
	void stop();
	bool is_running() const;

	AddResult add(const QString &call_id, const QString &recording_ref = QString(), bool force = false);
	BatchResult add_batch(const QVector<QueueJob> &jobs);
	ClearResult clear();

	// Callable from any thread.
	void update_stage(const QString &call_id, ProcessingStage stage);

	QueueStatus get_status() const;
	std::optional<QueueItem> find_active(const QString &call_id) const;

private:
	using ItemPtr = std::shared_ptr<QueueItem>;

	void schedule_dispatch(int delay_ms = 0);
	void dispatch_next();
	void begin_item(const ItemPtr &item);
	void on_item_finished();
	void on_retry_due();
	void apply_stage(const QString &call_id, ProcessingStage stage);
	void finish_success(const ItemPtr &item);
	void finish_failure(const ItemPtr &item, const QString &error);
	void append_history(QVector<QueueItem> *history, const QueueItem &item);
	void remove_from_index(const ItemPtr &item);
	bool is_indexed(const ItemPtr &item) const;
	QVector<ItemPtr> waiting_items() const;
	int position_of(const QString &call_id) const;
	void broadcast_status();

	static ProcessOutcome run_process_function(const ProcessFunction &fn, const QueueJob &job);

	QueueOptions m_options;
	ProcessFunction m_process_fn;
	BroadcastFunction m_broadcast_fn;

	QHash<QString, ItemPtr> m_items;
	QQueue<ItemPtr> m_pending;
	ItemPtr m_current;
	ItemPtr m_waiting;
	QVector<QueueItem> m_completed;
	QVector<QueueItem> m_failed;

	bool m_running = false;
	bool m_dispatch_scheduled = false;
	QTimer m_retry_timer;
	QThreadPool m_pool;
	QFutureWatcher<ProcessOutcome> m_watcher;
};

} // namespace cs

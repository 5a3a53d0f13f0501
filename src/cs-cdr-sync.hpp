#pragma once

#include "cs-config.hpp"
#include "cs-queue-item.hpp"

#include <QFutureWatcher>
#include <QObject>
#include <QTimer>
#include <QVector>

namespace cs {

class PbxClient;
class ProcessingQueue;
class TriggerCoordinator;

struct SyncScan {
	int pages = 0;
	int records = 0;
	QVector<QueueJob> jobs;
	QString error;
};

// Walks up to max_pages CDR pages and collects calls that still need a
// summary. Blocking; safe on any thread.
SyncScan scan_cdr_pages(PbxClient *pbx, TriggerCoordinator *coordinator, int max_pages, int page_size,
			bool process_internal_calls);

// Periodic bulk sync. Scans run on the global thread pool; the results are
// handed to the queue on the owning thread.
class CdrSync : public QObject {
public:
	CdrSync(PbxClient *pbx, TriggerCoordinator *coordinator, ProcessingQueue *queue, const TriggerConfig &config,
		int page_size, QObject *parent = nullptr);
	~CdrSync() override;

	void start();
	void stop();

	// Returns false when a pass is already in flight.
	bool sync_now(int max_pages);

private:
	void on_scan_finished();

	PbxClient *m_pbx = nullptr;
	TriggerCoordinator *m_coordinator = nullptr;
	ProcessingQueue *m_queue = nullptr;
	TriggerConfig m_config;
	int m_page_size = 100;
	QTimer m_timer;
	QFutureWatcher<SyncScan> m_watcher;
};

} // namespace cs

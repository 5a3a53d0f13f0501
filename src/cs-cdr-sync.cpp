#include "cs-cdr-sync.hpp"

#include "cs-cdr-filter.hpp"
#include "cs-log.hpp"
#include "cs-pbx-client.hpp"
#include "cs-processing-queue.hpp"
#include "cs-trigger-coordinator.hpp"

#include <QJsonArray>
#include <QSet>
#include <QtConcurrent>

namespace cs {

SyncScan scan_cdr_pages(PbxClient *pbx, TriggerCoordinator *coordinator, int max_pages, int page_size,
			bool process_internal_calls)
{
	SyncScan scan;
	QSet<QString> seen;
	for (int page = 1; page <= max_pages; ++page) {
		QJsonArray records;
		if (!pbx->fetch_cdr_page(page, page_size, &records, &scan.error))
			break;
		scan.pages = page;
		scan.records += static_cast<int>(records.size());

		for (const QJsonValue &value : records) {
			CdrCandidate candidate;
			if (!cdr_candidate(value.toObject(), process_internal_calls, &candidate))
				continue;
			if (seen.contains(candidate.call_id))
				continue;
			seen.insert(candidate.call_id);
			if (coordinator->should_process(candidate.call_id, false) != ProcessDecision::Process)
				continue;

			QueueJob job;
			job.call_id = candidate.call_id;
			job.recording_ref = candidate.recording_ref;
			scan.jobs.push_back(job);
		}

		if (records.size() < page_size)
			break;
	}
	return scan;
}

CdrSync::CdrSync(PbxClient *pbx, TriggerCoordinator *coordinator, ProcessingQueue *queue, const TriggerConfig &config,
		 int page_size, QObject *parent)
	: QObject(parent),
	  m_pbx(pbx),
	  m_coordinator(coordinator),
	  m_queue(queue),
	  m_config(config),
	  m_page_size(page_size > 0 ? page_size : 100)
{
	m_timer.setInterval(m_config.sync_interval_ms);
	connect(&m_timer, &QTimer::timeout, this, [this]() { sync_now(m_config.sync_live_pages); });
	connect(&m_watcher, &QFutureWatcher<SyncScan>::finished, this, [this]() { on_scan_finished(); });
}

CdrSync::~CdrSync()
{
	m_timer.stop();
	m_watcher.disconnect(this);
	m_watcher.waitForFinished();
}

void CdrSync::start()
{
	qCInfo(cs_log, "[sync] starting bulk sync (%d pages now, %d pages every %d ms)", m_config.sync_startup_pages,
	       m_config.sync_live_pages, m_config.sync_interval_ms);
	sync_now(m_config.sync_startup_pages);
	m_timer.start();
}

void CdrSync::stop()
{
	m_timer.stop();
}

bool CdrSync::sync_now(int max_pages)
{
	if (m_watcher.isRunning()) {
		qCDebug(cs_log, "[sync] previous pass still running");
		return false;
	}

	PbxClient *pbx = m_pbx;
	TriggerCoordinator *coordinator = m_coordinator;
	const int page_size = m_page_size;
	const bool internal = m_config.process_internal_calls;
	m_watcher.setFuture(QtConcurrent::run([pbx, coordinator, max_pages, page_size, internal]() {
		return scan_cdr_pages(pbx, coordinator, max_pages, page_size, internal);
	}));
	return true;
}

void CdrSync::on_scan_finished()
{
	const SyncScan scan = m_watcher.result();
	if (!scan.error.isEmpty())
		qCWarning(cs_log, "[sync] CDR fetch failed after %d pages: %s", scan.pages, qUtf8Printable(scan.error));

	if (scan.jobs.isEmpty()) {
		qCInfo(cs_log, "[sync] scanned %d CDRs on %d pages; nothing to queue", scan.records, scan.pages);
		return;
	}

	const BatchResult result = m_queue->add_batch(scan.jobs);
	qCInfo(cs_log, "[sync] scanned %d CDRs on %d pages; queued %lld, skipped %lld", scan.records, scan.pages,
	       static_cast<long long>(result.added.size()), static_cast<long long>(result.skipped.size()));
}

} // namespace cs

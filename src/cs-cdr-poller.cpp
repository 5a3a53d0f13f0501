#include "cs-cdr-poller.hpp"

#include "cs-cdr-filter.hpp"
#include "cs-log.hpp"
#include "cs-pbx-client.hpp"
#include "cs-trigger-coordinator.hpp"

#include <QJsonArray>
#include <QTimer>

namespace cs {

CdrPoller::CdrPoller(PbxClient *pbx, TriggerCoordinator *coordinator, const TriggerConfig &config)
	: m_pbx(pbx),
	  m_coordinator(coordinator),
	  m_config(config)
{
}

void CdrPoller::start_polling()
{
	if (!m_timer) {
		m_timer = new QTimer(this);
		connect(m_timer, &QTimer::timeout, this, [this]() {
			m_timer->setInterval(m_config.poller_interval_ms);
			poll_once();
		});
	}
	qCInfo(cs_log, "[poller] started on its own thread (first poll in %d ms, then every %d ms)",
	       m_config.poller_startup_delay_ms, m_config.poller_interval_ms);
	m_timer->start(m_config.poller_startup_delay_ms);
}

void CdrPoller::stop_polling()
{
	if (m_timer)
		m_timer->stop();
	qCInfo(cs_log, "[poller] stopped");
}

int CdrPoller::poll_once()
{
	m_passes.fetch_add(1);

	QJsonArray records;
	QString error;
	if (!m_pbx->fetch_cdr_page(1, m_config.poller_page_size, &records, &error)) {
		qCWarning(cs_log, "[poller] CDR fetch failed: %s", qUtf8Printable(error));
		return 0;
	}
	qCInfo(cs_log, "[poller] fetched %lld recent CDRs", static_cast<long long>(records.size()));

	int processed = 0;
	for (const QJsonValue &value : records) {
		CdrCandidate candidate;
		if (!cdr_candidate(value.toObject(), m_config.process_internal_calls, &candidate))
			continue;

		const ProcessDecision decision = m_coordinator->should_process(candidate.call_id, false);
		if (decision != ProcessDecision::Process) {
			qCDebug(cs_log, "[poller] skipping %s: %s", qUtf8Printable(candidate.call_id),
				process_decision_to_key(decision));
			continue;
		}

		QueueJob job;
		job.call_id = candidate.call_id;
		job.recording_ref = candidate.recording_ref;
		qCInfo(cs_log, "[poller] auto-processing new call %s (%s)", qUtf8Printable(job.call_id),
		       qUtf8Printable(candidate.call_type));
		if (m_coordinator->run_direct(job, "poller"))
			++processed;
	}

	if (processed == 0)
		qCInfo(cs_log, "[poller] no new calls to process");
	return processed;
}

PollerThread::PollerThread(PbxClient *pbx, TriggerCoordinator *coordinator, const TriggerConfig &config)
	: m_poller(std::make_unique<CdrPoller>(pbx, coordinator, config))
{
	m_thread.setObjectName("cdr-poller");
	m_poller->moveToThread(&m_thread);
}

PollerThread::~PollerThread()
{
	stop();
}

void PollerThread::start()
{
	if (m_thread.isRunning())
		return;
	m_thread.start();
	CdrPoller *poller = m_poller.get();
	QMetaObject::invokeMethod(
		poller, [poller]() { poller->start_polling(); }, Qt::QueuedConnection);
}

void PollerThread::stop()
{
	if (!m_thread.isRunning())
		return;
	CdrPoller *poller = m_poller.get();
	QMetaObject::invokeMethod(
		poller, [poller]() { poller->stop_polling(); }, Qt::BlockingQueuedConnection);
	m_thread.quit();
	m_thread.wait();
}

bool PollerThread::is_running() const
{
	return m_thread.isRunning();
}

} // namespace cs

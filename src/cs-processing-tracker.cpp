#include "cs-processing-tracker.hpp"

#include "cs-log.hpp"

namespace cs {

bool ProcessingTracker::try_acquire(const QString &call_id)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_processing.contains(call_id))
		return false;
	m_processing.insert(call_id);
	return true;
}

void ProcessingTracker::release(const QString &call_id)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_processing.remove(call_id);
}

bool ProcessingTracker::is_processing(const QString &call_id) const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_processing.contains(call_id);
}

int ProcessingTracker::active_count() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return static_cast<int>(m_processing.size());
}

TrackerLease::TrackerLease(ProcessingTracker *tracker, const QString &call_id) : m_tracker(tracker), m_call_id(call_id)
{
	if (m_tracker)
		m_acquired = m_tracker->try_acquire(m_call_id);
	if (!m_acquired)
		qCDebug(cs_log, "[tracker] %s already held by another trigger", qUtf8Printable(m_call_id));
}

TrackerLease::~TrackerLease()
{
	if (m_tracker && m_acquired)
		m_tracker->release(m_call_id);
}

} // namespace cs

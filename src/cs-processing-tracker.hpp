#pragma once

#include <QSet>
#include <QString>

#include <mutex>

namespace cs {

// Process-wide exclusion keyed by call id. Safe to use from any thread,
// including threads that run their own event loop.
class ProcessingTracker {
public:
	ProcessingTracker() = default;
	ProcessingTracker(const ProcessingTracker &) = delete;
	ProcessingTracker &operator=(const ProcessingTracker &) = delete;

	// True iff the caller is now the only holder of call_id.
	bool try_acquire(const QString &call_id);
	void release(const QString &call_id);

	// Advisory only; exclusion lives in try_acquire.
	bool is_processing(const QString &call_id) const;
	int active_count() const;

private:
	mutable std::mutex m_mutex;
	QSet<QString> m_processing;
};

// Holds a tracker slot for the lifetime of the object.
class TrackerLease {
public:
	TrackerLease(ProcessingTracker *tracker, const QString &call_id);
	~TrackerLease();

	TrackerLease(const TrackerLease &) = delete;
	TrackerLease &operator=(const TrackerLease &) = delete;

	bool acquired() const { return m_acquired; }

private:
	ProcessingTracker *m_tracker = nullptr;
	QString m_call_id;
	bool m_acquired = false;
};

} // namespace cs

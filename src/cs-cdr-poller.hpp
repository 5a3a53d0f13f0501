#pragma once

#include "cs-config.hpp"

#include <QObject>
#include <QThread>

#include <atomic>
#include <memory>

class QTimer;

namespace cs {

class PbxClient;
class TriggerCoordinator;

// Polls the newest CDR page and processes eligible calls directly on the
// thread that owns it. Shares nothing with the main thread except the tracker
// and the store.
class CdrPoller : public QObject {
public:
	CdrPoller(PbxClient *pbx, TriggerCoordinator *coordinator, const TriggerConfig &config);

	// Must run on the poller's own thread.
	void start_polling();
	void stop_polling();

	// Returns the number of calls processed in this pass.
	int poll_once();

	int passes() const { return m_passes.load(); }

private:
	PbxClient *m_pbx = nullptr;
	TriggerCoordinator *m_coordinator = nullptr;
	TriggerConfig m_config;
	QTimer *m_timer = nullptr;
	std::atomic<int> m_passes{0};
};

// Owns the poller's QThread and its event loop.
class PollerThread {
public:
	PollerThread(PbxClient *pbx, TriggerCoordinator *coordinator, const TriggerConfig &config);
	~PollerThread();

	PollerThread(const PollerThread &) = delete;
	PollerThread &operator=(const PollerThread &) = delete;

	void start();
	void stop();
	bool is_running() const;

private:
	QThread m_thread;
	std::unique_ptr<CdrPoller> m_poller;
};

} // namespace cs

/*
callscribe
Copyright (C) 2026 callscribe contributors

This program is free software; you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation; either version 2 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program. If not, see <https://www.gnu.org/licenses/>
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSocketNotifier>

#include <csignal>
#include <memory>
#include <sys/socket.h>
#include <unistd.h>

#include "cs-analysis-backend.hpp"
#include "cs-cdr-poller.hpp"
#include "cs-cdr-sync.hpp"
#include "cs-config.hpp"
#include "cs-http-api.hpp"
#include "cs-log.hpp"
#include "cs-pbx-client.hpp"
#include "cs-processing-queue.hpp"
#include "cs-processing-tracker.hpp"
#include "cs-recording-processor.hpp"
#include "cs-status-hub.hpp"
#include "cs-summary-store.hpp"
#include "cs-trigger-coordinator.hpp"
#include "cs-webhook-receiver.hpp"

namespace {

int g_signal_fds[2] = {-1, -1};

void on_unix_signal(int)
{
	const char byte = 1;
	const ssize_t written = ::write(g_signal_fds[0], &byte, sizeof(byte));
	(void)written;
}

// Turns SIGINT/SIGTERM into an event-loop quit through a socket pair.
bool install_signal_handlers(QCoreApplication *app)
{
	if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signal_fds) != 0)
		return false;

	auto *notifier = new QSocketNotifier(g_signal_fds[1], QSocketNotifier::Read, app);
	QObject::connect(notifier, &QSocketNotifier::activated, app, [app, notifier]() {
		notifier->setEnabled(false);
		char byte = 0;
		const ssize_t read_bytes = ::read(g_signal_fds[1], &byte, sizeof(byte));
		(void)read_bytes;
		qCInfo(cs_log, "shutdown signal received");
		app->quit();
	});

	struct sigaction action = {};
	action.sa_handler = on_unix_signal;
	sigemptyset(&action.sa_mask);
	action.sa_flags = SA_RESTART;
	return ::sigaction(SIGINT, &action, nullptr) == 0 && ::sigaction(SIGTERM, &action, nullptr) == 0;
}

cs::QueueOptions queue_options_from(const cs::QueueConfig &config)
{
	cs::QueueOptions options;
	options.max_retries = config.max_retries;
	options.retry_base_delay_ms = config.retry_base_delay_ms;
	options.history_limit = config.history_limit;
	options.dispatch_cooldown_ms = config.dispatch_cooldown_ms;
	options.max_residency_ms = config.max_residency_ms;
	return options;
}

cs::ProcessorOptions processor_options_from(const cs::AppConfig &config)
{
	cs::ProcessorOptions options;
	options.recording_lookup_pages = config.pbx.recording_lookup_pages;
	options.page_size = config.pbx.page_size;
	options.download_timeout_ms = config.analysis.download_timeout_ms;
	options.max_concurrent_inference = config.analysis.max_concurrent_inference;
	return options;
}

// Owns every component; members are declared so that each one outlives the
// components that call into it.
class CallscribeService {
public:
	explicit CallscribeService(const cs::AppConfig &config)
		: m_config(config),
		  m_store(config.database.sqlite_path),
		  m_pbx(config.pbx),
		  m_backend(config.analysis),
		  m_processor(&m_pbx, &m_backend, &m_store, processor_options_from(config)),
		  m_coordinator(&m_tracker, &m_store, &m_processor),
		  m_queue(queue_options_from(config.queue)),
		  m_webhook(&m_coordinator, config.triggers),
		  m_sync(&m_pbx, &m_coordinator, &m_queue, config.triggers, config.pbx.page_size),
		  m_poller(&m_pbx, &m_coordinator, config.triggers),
		  m_http(config.http, &m_queue, &m_coordinator, &m_tracker, &m_webhook, &m_hub)
	{
	}

	~CallscribeService() { stop(); }

	bool start(QString *error)
	{
		if (!m_store.open(error))
			return false;

		m_queue.set_process_function(m_coordinator.queue_process_function(&m_queue));
		if (m_config.status_hub.enabled) {
			if (!m_hub.listen(m_config.http.host, static_cast<quint16>(m_config.status_hub.port), error))
				return false;
			cs::StatusHub *hub = &m_hub;
			m_queue.set_broadcast_function([hub](const QJsonObject &status) { hub->broadcast(status); });
			m_processor.set_analysis_listener([hub](const QJsonObject &summary) { hub->publish_summary(summary); });
		}

		if (!m_http.listen(error))
			return false;

		m_queue.start();

		const bool pbx_configured = !m_config.pbx.base_url.isEmpty();
		if (m_config.triggers.auto_process_calls && pbx_configured) {
			m_sync.start();
			m_poller.start();
		} else if (!pbx_configured) {
			qCWarning(cs_log, "PBX base URL not configured; bulk sync and poller disabled");
		}

		m_started = true;
		qCInfo(cs_log, "callscribe started");
		return true;
	}

	void stop()
	{
		if (!m_started)
			return;
		m_started = false;

		m_poller.stop();
		m_sync.stop();
		m_queue.stop();
		m_http.close();
		m_webhook.shutdown();
		m_hub.close();
		qCInfo(cs_log, "callscribe stopped");
	}

private:
	cs::AppConfig m_config;
	cs::ProcessingTracker m_tracker;
	cs::SummaryStore m_store;
	cs::HttpPbxClient m_pbx;
	cs::HttpAnalysisBackend m_backend;
	cs::StatusHub m_hub;
	cs::RecordingProcessor m_processor;
	cs::TriggerCoordinator m_coordinator;
	cs::ProcessingQueue m_queue;
	cs::WebhookReceiver m_webhook;
	cs::CdrSync m_sync;
	cs::PollerThread m_poller;
	cs::HttpApi m_http;
	bool m_started = false;
};

} // namespace

int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName("callscribe");
	QCoreApplication::setApplicationVersion("1.0.0");

	QCommandLineParser parser;
	parser.setApplicationDescription("Call recording transcription and analysis service");
	parser.addHelpOption();
	parser.addVersionOption();
	const QCommandLineOption config_option("config", "Path to the JSON configuration file.", "path",
					       "callscribe.json");
	const QCommandLineOption verbose_option(QStringList{"v", "verbose"}, "Enable debug logging.");
	const QCommandLineOption write_config_option("write-default-config",
						     "Write the effective configuration to the config path and exit.");
	parser.addOption(config_option);
	parser.addOption(verbose_option);
	parser.addOption(write_config_option);
	parser.process(app);

	cs::install_log_format(parser.isSet(verbose_option));

	const QString config_path = parser.value(config_option);
	cs::AppConfig config;
	QString error;
	if (!cs::load_app_config(config_path, &config, &error)) {
		qCCritical(cs_log, "failed to load config %s: %s", qUtf8Printable(config_path), qUtf8Printable(error));
		return 1;
	}

	if (parser.isSet(write_config_option)) {
		if (!cs::save_app_config(config_path, config)) {
			qCCritical(cs_log, "failed to write config %s", qUtf8Printable(config_path));
			return 1;
		}
		qCInfo(cs_log, "wrote configuration to %s", qUtf8Printable(config_path));
		return 0;
	}

	if (!install_signal_handlers(&app))
		qCWarning(cs_log, "could not install signal handlers");

	CallscribeService service(config);
	if (!service.start(&error)) {
		qCCritical(cs_log, "startup failed: %s", qUtf8Printable(error));
		return 1;
	}

	const int exit_code = app.exec();
	service.stop();
	return exit_code;
}

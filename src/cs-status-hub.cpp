#include "cs-status-hub.hpp"

#include "cs-log.hpp"

#include <QHostAddress>
#include <QJsonDocument>
#include <QThread>
#include <QWebSocket>
#include <QWebSocketServer>

namespace cs {

StatusHub::StatusHub(QObject *parent)
	: QObject(parent),
	  m_server(new QWebSocketServer("callscribe-status", QWebSocketServer::NonSecureMode, this))
{
	connect(m_server, &QWebSocketServer::newConnection, this, [this]() { on_new_connection(); });
}

StatusHub::~StatusHub()
{
	close();
}

bool StatusHub::listen(const QString &host, quint16 port, QString *error)
{
	const QHostAddress address = host.isEmpty() || host == "0.0.0.0" ? QHostAddress(QHostAddress::Any)
									  : QHostAddress(host);
	if (!m_server->listen(address, port)) {
		if (error)
			*error = m_server->errorString();
		return false;
	}
	qCInfo(cs_log, "[hub] status hub listening on port %u", static_cast<unsigned>(m_server->serverPort()));
	return true;
}

void StatusHub::close()
{
	for (QWebSocket *client : m_clients) {
		client->disconnect(this);
		client->close();
		client->deleteLater();
	}
	m_clients.clear();
	if (m_server->isListening())
		m_server->close();
}

quint16 StatusHub::port() const
{
	return m_server->serverPort();
}

void StatusHub::broadcast(const QJsonObject &message)
{
	const QByteArray payload = QJsonDocument(message).toJson(QJsonDocument::Compact);
	if (QThread::currentThread() != thread()) {
		QMetaObject::invokeMethod(
			this, [this, payload]() { send_to_all(payload); }, Qt::QueuedConnection);
		return;
	}
	send_to_all(payload);
}

void StatusHub::publish_summary(const QJsonObject &summary)
{
	QJsonObject processed;
	processed.insert("type", "summary_processed");
	processed.insert("call_id", summary.value("call_id"));
	processed.insert("summary", summary);
	broadcast(processed);

	QJsonObject update;
	update.insert("type", "analytics_update");
	broadcast(update);
}

int StatusHub::client_count() const
{
	return static_cast<int>(m_clients.size());
}

void StatusHub::on_new_connection()
{
	while (m_server->hasPendingConnections()) {
		QWebSocket *client = m_server->nextPendingConnection();
		if (!client)
			break;
		client->setParent(this);
		m_clients.push_back(client);
		connect(client, &QWebSocket::textMessageReceived, this,
			[this, client](const QString &message) { on_text_message(client, message); });
		connect(client, &QWebSocket::disconnected, this, [this, client]() { drop_client(client); });
		qCInfo(cs_log, "[hub] client connected from %s (%d total)", qUtf8Printable(client->peerAddress().toString()),
		       client_count());
	}
}

void StatusHub::on_text_message(QWebSocket *client, const QString &message)
{
	if (message == "ping")
		client->sendTextMessage("pong");
}

void StatusHub::drop_client(QWebSocket *client)
{
	if (!m_clients.removeOne(client))
		return;
	client->disconnect(this);
	client->deleteLater();
	qCInfo(cs_log, "[hub] client disconnected (%d remaining)", client_count());
}

void StatusHub::send_to_all(const QByteArray &payload)
{
	const QString text = QString::fromUtf8(payload);
	const QList<QWebSocket *> clients = m_clients;
	for (QWebSocket *client : clients) {
		if (!client->isValid() || client->sendTextMessage(text) < 0) {
			qCDebug(cs_log, "[hub] dropping dead client");
			drop_client(client);
		}
	}
}

} // namespace cs

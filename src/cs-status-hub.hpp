#pragma once

#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>

class QWebSocket;
class QWebSocketServer;

namespace cs {

// WebSocket fan-out for queue snapshots and analysis notifications. Delivery
// is best effort; a client that fails to take a message is dropped.
class StatusHub : public QObject {
public:
	explicit StatusHub(QObject *parent = nullptr);
	~StatusHub() override;

	bool listen(const QString &host, quint16 port, QString *error);
	void close();
	quint16 port() const;

	// Callable from any thread.
	void broadcast(const QJsonObject &message);
	void publish_summary(const QJsonObject &summary);

	int client_count() const;

private:
	void on_new_connection();
	void on_text_message(QWebSocket *client, const QString &message);
	void drop_client(QWebSocket *client);
	void send_to_all(const QByteArray &payload);

	QWebSocketServer *m_server = nullptr;
	QList<QWebSocket *> m_clients;
};

} // namespace cs

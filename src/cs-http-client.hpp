#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QNetworkRequest>
#include <QString>
#include <QUrl>

class QHttpMultiPart;

namespace cs {

struct HttpReply {
	int status_code = 0;
	QByteArray body;
};

// Blocking helpers built on a private QNetworkAccessManager and a local event
// loop, so they can be called from any thread (pool workers, the poller thread).
// They return false on transport errors, timeouts and non-2xx statuses.
bool http_get(const QNetworkRequest &request, int timeout_ms, HttpReply *out_reply, QString *error);
bool http_post(const QNetworkRequest &request, const QByteArray &body, int timeout_ms, HttpReply *out_reply,
	       QString *error);
bool http_post_multipart(const QNetworkRequest &request, QHttpMultiPart *multipart, int timeout_ms,
			 HttpReply *out_reply, QString *error);

// Streams the resource to file_path. Works for http(s) and file URLs.
bool http_download(const QUrl &url, const QString &file_path, int timeout_ms, qint64 *out_bytes, QString *error);

bool parse_json_object(const QByteArray &body, QJsonObject *out_obj, QString *error);

} // namespace cs

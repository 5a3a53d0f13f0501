#include "cs-http-client.hpp"

#include "cs-log.hpp"

#include <QEventLoop>
#include <QFile>
#include <QHttpMultiPart>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QTimer>

namespace cs {
namespace {

void set_error(QString *error, const QString &message)
{
	if (error)
		*error = message;
}

// Runs a local event loop until the reply finishes or the timeout fires.
bool wait_for_reply(QNetworkReply *reply, int timeout_ms, bool *timed_out)
{
	QEventLoop loop;
	QTimer timer;
	timer.setSingleShot(true);
	*timed_out = false;

	QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
	QObject::connect(&timer, &QTimer::timeout, &loop, [&loop, reply, timed_out]() {
		*timed_out = true;
		reply->abort();
		loop.quit();
	});

	if (!reply->isFinished()) {
		if (timeout_ms > 0)
			timer.start(timeout_ms);
		loop.exec();
	}
	return !*timed_out;
}

bool finish_reply(QNetworkReply *reply, const QUrl &url, int timeout_ms, HttpReply *out_reply, QString *error)
{
	bool timed_out = false;
	wait_for_reply(reply, timeout_ms, &timed_out);

	const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
	HttpReply result;
	result.status_code = status.isValid() ? status.toInt() : 0;
	result.body = reply->readAll();

	if (timed_out) {
		set_error(error, QString("Request to %1 timed out after %2 ms").arg(url.toDisplayString()).arg(timeout_ms));
		reply->deleteLater();
		return false;
	}
	if (reply->error() != QNetworkReply::NoError && result.status_code == 0) {
		set_error(error, QString("Request to %1 failed: %2").arg(url.toDisplayString(), reply->errorString()));
		reply->deleteLater();
		return false;
	}
	reply->deleteLater();

	if (out_reply)
		*out_reply = result;
	if (result.status_code != 0 && (result.status_code < 200 || result.status_code >= 300)) {
		set_error(error, QString("Request to %1 returned HTTP %2: %3")
					 .arg(url.toDisplayString())
					 .arg(result.status_code)
					 .arg(QString::fromUtf8(result.body.left(200))));
		return false;
	}
	return true;
}

} // namespace

bool http_get(const QNetworkRequest &request, int timeout_ms, HttpReply *out_reply, QString *error)
{
	QNetworkAccessManager manager;
	QNetworkReply *reply = manager.get(request);
	return finish_reply(reply, request.url(), timeout_ms, out_reply, error);
}

bool http_post(const QNetworkRequest &request, const QByteArray &body, int timeout_ms, HttpReply *out_reply,
	       QString *error)
{
	QNetworkAccessManager manager;
	QNetworkReply *reply = manager.post(request, body);
	return finish_reply(reply, request.url(), timeout_ms, out_reply, error);
}

bool http_post_multipart(const QNetworkRequest &request, QHttpMultiPart *multipart, int timeout_ms,
			 HttpReply *out_reply, QString *error)
{
	QNetworkAccessManager manager;
	QNetworkReply *reply = manager.post(request, multipart);
	return finish_reply(reply, request.url(), timeout_ms, out_reply, error);
}

bool http_download(const QUrl &url, const QString &file_path, int timeout_ms, qint64 *out_bytes, QString *error)
{
	QFile file(file_path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		set_error(error, QString("Failed to open %1 for writing").arg(file_path));
		return false;
	}

	QNetworkRequest request(url);
	request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);

	QNetworkAccessManager manager;
	QNetworkReply *reply = manager.get(request);
	qint64 written = 0;
	bool write_failed = false;
	QObject::connect(reply, &QNetworkReply::readyRead, reply, [&]() {
		const QByteArray chunk = reply->readAll();
		if (file.write(chunk) != chunk.size())
			write_failed = true;
		written += chunk.size();
	});

	HttpReply tail;
	const bool ok = finish_reply(reply, url, timeout_ms, &tail, error);
	if (!tail.body.isEmpty()) {
		if (file.write(tail.body) != tail.body.size())
			write_failed = true;
		written += tail.body.size();
	}
	file.close();

	if (!ok)
		return false;
	if (write_failed) {
		set_error(error, QString("Failed to write %1").arg(file_path));
		return false;
	}
	if (out_bytes)
		*out_bytes = written;
	qCDebug(cs_log, "[http] downloaded %lld bytes from %s", static_cast<long long>(written),
		qUtf8Printable(url.toDisplayString()));
	return true;
}

bool parse_json_object(const QByteArray &body, QJsonObject *out_obj, QString *error)
{
	QJsonParseError parse_error;
	const QJsonDocument doc = QJsonDocument::fromJson(body, &parse_error);
	if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
		set_error(error, parse_error.error != QJsonParseError::NoError ? parse_error.errorString()
									   : QString("Expected a JSON object"));
		return false;
	}
	*out_obj = doc.object();
	return true;
}

} // namespace cs

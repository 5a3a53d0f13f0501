#include "cs-pbx-client.hpp"

#include "cs-http-client.hpp"
#include "cs-log.hpp"

#include <QJsonObject>
#include <QNetworkRequest>
#include <QUrlQuery>

namespace cs {
namespace {

constexpr const char *kApiPrefix = "/openapi/v1.0";

void set_error(QString *error, const QString &message)
{
	if (error)
		*error = message;
}

QString api_error_message(const QJsonObject &response)
{
	const QString errmsg = response.value("errmsg").toString();
	return QString("PBX error %1: %2").arg(response.value("errcode").toInt()).arg(errmsg.isEmpty() ? "unknown" : errmsg);
}

} // namespace

bool find_recording_for_call(PbxClient *client, const QString &call_id, int max_pages, int page_size,
			     QString *out_recording_ref, QString *error)
{
	out_recording_ref->clear();
	for (int page = 1; page <= max_pages; ++page) {
		QJsonArray records;
		if (!client->fetch_recording_page(page, page_size, &records, error))
			return false;

		for (const QJsonValue &value : records) {
			const QJsonObject record = value.toObject();
			if (record.value("uid").toString() == call_id) {
				*out_recording_ref = record.value("file").toString();
				qCInfo(cs_log, "[processor] found recording for %s on page %d: %s",
				       qUtf8Printable(call_id), page, qUtf8Printable(*out_recording_ref));
				return true;
			}
		}

		if (records.size() < page_size)
			break;
	}
	return true;
}

HttpPbxClient::HttpPbxClient(const PbxConfig &config) : m_config(config) {}

bool HttpPbxClient::fetch_cdr_page(int page, int page_size, QJsonArray *out_records, QString *error)
{
	return get_data_page("/cdr/list", page, page_size, out_records, error);
}

bool HttpPbxClient::fetch_recording_page(int page, int page_size, QJsonArray *out_records, QString *error)
{
	return get_data_page("/recording/list", page, page_size, out_records, error);
}

bool HttpPbxClient::resolve_download_url(const QString &recording_ref, QUrl *out_url, QString *error)
{
	// File names may contain '+', which a form-style query would read as a space.
	QUrl url = endpoint("/recording/download");
	url.setQuery(QString("file=%1&%2")
			     .arg(QString::fromLatin1(QUrl::toPercentEncoding(recording_ref)), url.query(QUrl::FullyEncoded)),
		     QUrl::StrictMode);

	QNetworkRequest request(url);
	request.setRawHeader("User-Agent", "OpenAPI");
	HttpReply reply;
	if (!http_get(request, m_config.request_timeout_ms, &reply, error))
		return false;

	QJsonObject response;
	if (!parse_json_object(reply.body, &response, error))
		return false;
	if (response.value("errcode").toInt(-1) != 0) {
		set_error(error, api_error_message(response));
		return false;
	}

	const QString resource = response.value("download_resource_url").toString();
	if (resource.isEmpty()) {
		set_error(error, "Recording file not available");
		return false;
	}

	QUrl download(m_config.base_url + resource);
	QUrlQuery download_query(download);
	download_query.addQueryItem("access_token", m_config.access_token);
	download.setQuery(download_query);
	*out_url = download;
	return true;
}

QUrl HttpPbxClient::endpoint(const QString &path) const
{
	QUrl url(m_config.base_url + kApiPrefix + path);
	QUrlQuery query;
	query.addQueryItem("access_token", m_config.access_token);
	url.setQuery(query);
	return url;
}

bool HttpPbxClient::get_data_page(const QString &path, int page, int page_size, QJsonArray *out_records,
				  QString *error)
{
	if (m_config.base_url.isEmpty()) {
		set_error(error, "PBX base URL is not configured");
		return false;
	}

	QUrl url = endpoint(path);
	QUrlQuery query(url);
	query.addQueryItem("page", QString::number(page));
	query.addQueryItem("page_size", QString::number(page_size));
	query.addQueryItem("sort_by", path == "/cdr/list" ? "time" : "id");
	query.addQueryItem("order_by", "desc");
	url.setQuery(query);

	HttpReply reply;
	if (!http_get(QNetworkRequest(url), m_config.request_timeout_ms, &reply, error))
		return false;

	QJsonObject response;
	if (!parse_json_object(reply.body, &response, error))
		return false;
	if (response.value("errcode").toInt(-1) != 0) {
		set_error(error, api_error_message(response));
		return false;
	}

	*out_records = response.value("data").toArray();
	return true;
}

} // namespace cs

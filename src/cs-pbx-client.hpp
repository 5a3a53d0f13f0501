#pragma once

#include "cs-config.hpp"

#include <QJsonArray>
#include <QString>
#include <QUrl>

namespace cs {

// Read-only view of the PBX REST API used by the pipeline and the triggers.
class PbxClient {
public:
	virtual ~PbxClient() = default;

	// Newest first. page is 1-based.
	virtual bool fetch_cdr_page(int page, int page_size, QJsonArray *out_records, QString *error) = 0;
	virtual bool fetch_recording_page(int page, int page_size, QJsonArray *out_records, QString *error) = 0;
	virtual bool resolve_download_url(const QString &recording_ref, QUrl *out_url, QString *error) = 0;
};

// Scans up to max_pages recording pages for the entry whose uid matches
// call_id. Returns false only on a transport failure; a missing recording
// yields true with an empty out_recording_ref.
bool find_recording_for_call(PbxClient *client, const QString &call_id, int max_pages, int page_size,
			     QString *out_recording_ref, QString *error);

// Yeastar Cloud OpenAPI client authenticated by a preconfigured access token.
class HttpPbxClient : public PbxClient {
public:
	explicit HttpPbxClient(const PbxConfig &config);

	bool fetch_cdr_page(int page, int page_size, QJsonArray *out_records, QString *error) override;
	bool fetch_recording_page(int page, int page_size, QJsonArray *out_records, QString *error) override;
	bool resolve_download_url(const QString &recording_ref, QUrl *out_url, QString *error) override;

private:
	QUrl endpoint(const QString &path) const;
	bool get_data_page(const QString &path, int page, int page_size, QJsonArray *out_records, QString *error);

	PbxConfig m_config;
};

} // namespace cs

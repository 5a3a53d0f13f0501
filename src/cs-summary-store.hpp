#pragma once

#include <QJsonObject>
#include <QSqlDatabase>
#include <QString>

#include <atomic>
#include <optional>

namespace cs {

struct SummaryRecord {
	QString call_id;
	QString recording_ref;
	QString language;
	QString transcript_preview;
	QString call_type;
	QString summary;
	QString sentiment;
	QJsonObject analysis;
	double processing_seconds = 0.0;
	QString model_used;
	QString error_message;
	QString created_at;
	QString updated_at;

	bool has_error() const { return !error_message.isEmpty(); }
};

QJsonObject summary_record_to_json(const SummaryRecord &record);

// Persisted per-call summaries in SQLite. Every operation opens and removes its
// own connection, so the store may be shared by the queue worker, the poller
// thread, pool threads and the request handlers.
class SummaryStore {
public:
	explicit SummaryStore(const QString &sqlite_path);

	SummaryStore(const SummaryStore &) = delete;
	SummaryStore &operator=(const SummaryStore &) = delete;

	bool open(QString *error);

	// A row exists for call_id and it carries no error.
	bool has_completed_summary(const QString &call_id, QString *error = nullptr);
	std::optional<SummaryRecord> find(const QString &call_id, QString *error = nullptr);

	bool upsert_summary(const SummaryRecord &record, QString *error);
	bool save_error(const QString &call_id, const QString &error_message, const QString &recording_ref,
			QString *error);

private:
	QString next_connection_name();
	bool connection(const QString &name, QSqlDatabase *out_db, QString *error);
	bool insert_row(QSqlDatabase &db, const SummaryRecord &record, bool *raced, QString *error);

	QString m_sqlite_path;
	QString m_connection_prefix;
	std::atomic<quint64> m_next_connection{1};
};

} // namespace cs

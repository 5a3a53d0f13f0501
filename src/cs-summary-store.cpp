#include "cs-summary-store.hpp"

#include "cs-log.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSqlError>
#include <QSqlQuery>
#include <QUuid>
#include <QVariant>

#include <atomic>

namespace cs {
namespace {

constexpr const char *kCreateTableSql = "CREATE TABLE IF NOT EXISTS call_summaries ("
					"id INTEGER PRIMARY KEY AUTOINCREMENT,"
					"call_id TEXT NOT NULL UNIQUE,"
					"recording_file TEXT,"
					"language_detected TEXT,"
					"transcript_preview TEXT,"
					"call_type TEXT,"
					"summary TEXT,"
					"sentiment TEXT,"
					"analysis_json TEXT,"
					"processing_time_seconds REAL,"
					"model_used TEXT,"
					"error_message TEXT,"
					"created_at TEXT,"
					"updated_at TEXT)";

QString utc_now_iso()
{
	return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

QVariant nullable(const QString &value)
{
	if (value.isEmpty())
		return QVariant();
	return value;
}

bool is_unique_violation(const QSqlError &sql_error)
{
	const QString code = sql_error.nativeErrorCode();
	if (code == "2067" || code == "1555")
		return true;
	return code == "19" && sql_error.databaseText().contains("UNIQUE", Qt::CaseInsensitive);
}

void set_error(QString *error, const QString &message)
{
	if (error)
		*error = message;
}

// Closes and unregisters a connection when the operation that opened it
// returns. Must be declared before any QSqlDatabase or QSqlQuery using it.
class ConnectionGuard {
public:
	explicit ConnectionGuard(const QString &name) : m_name(name) {}
	~ConnectionGuard()
	{
		{
			QSqlDatabase db = QSqlDatabase::database(m_name, false);
			if (db.isOpen())
				db.close();
		}
		QSqlDatabase::removeDatabase(m_name);
	}

	ConnectionGuard(const ConnectionGuard &) = delete;
	ConnectionGuard &operator=(const ConnectionGuard &) = delete;

	const QString &name() const { return m_name; }

private:
	QString m_name;
};

} // namespace

QJsonObject summary_record_to_json(const SummaryRecord &record)
{
	QJsonObject json_obj;
	json_obj.insert("call_id", record.call_id);
	json_obj.insert("recording_file", record.recording_ref);
	json_obj.insert("language_detected", record.language);
	json_obj.insert("transcript_preview", record.transcript_preview);
	json_obj.insert("call_type", record.call_type);
	json_obj.insert("summary", record.summary);
	json_obj.insert("sentiment", record.sentiment);
	json_obj.insert("analysis", record.analysis);
	json_obj.insert("processing_time_seconds", record.processing_seconds);
	json_obj.insert("model_used", record.model_used);
	json_obj.insert("error_message", record.error_message.isEmpty() ? QJsonValue(QJsonValue::Null)
									: QJsonValue(record.error_message));
	json_obj.insert("created_at", record.created_at);
	json_obj.insert("updated_at", record.updated_at);
	return json_obj;
}

SummaryStore::SummaryStore(const QString &sqlite_path)
	: m_sqlite_path(sqlite_path),
	  m_connection_prefix("callscribe-" + QUuid::createUuid().toString(QUuid::WithoutBraces))
{
}

bool SummaryStore::open(QString *error)
{
	const QFileInfo info(m_sqlite_path);
	QDir dir = info.dir();
	if (!dir.exists() && !dir.mkpath(".")) {
		set_error(error, QString("Failed to create database directory for %1").arg(m_sqlite_path));
		return false;
	}

	ConnectionGuard guard(next_connection_name());
	QSqlDatabase db;
	if (!connection(guard.name(), &db, error))
		return false;

	QSqlQuery query(db);
	if (!query.exec(kCreateTableSql)) {
		set_error(error, query.lastError().text());
		return false;
	}
	qCInfo(cs_log, "[store] summaries database ready at %s", qUtf8Printable(m_sqlite_path));
	return true;
}

bool SummaryStore::has_completed_summary(const QString &call_id, QString *error)
{
	QString find_error;
	const std::optional<SummaryRecord> record = find(call_id, &find_error);
	if (!find_error.isEmpty())
		set_error(error, find_error);
	return record && !record->has_error();
}

std::optional<SummaryRecord> SummaryStore::find(const QString &call_id, QString *error)
{
	ConnectionGuard guard(next_connection_name());
	QSqlDatabase db;
	if (!connection(guard.name(), &db, error))
		return std::nullopt;

	QSqlQuery query(db);
	query.prepare("SELECT call_id, recording_file, language_detected, transcript_preview, call_type, summary, "
		      "sentiment, analysis_json, processing_time_seconds, model_used, error_message, created_at, "
		      "updated_at FROM call_summaries WHERE call_id = ?");
	query.addBindValue(call_id);
	if (!query.exec()) {
		set_error(error, query.lastError().text());
		return std::nullopt;
	}
	if (!query.next())
		return std::nullopt;

	SummaryRecord record;
	record.call_id = query.value(0).toString();
	record.recording_ref = query.value(1).toString();
	record.language = query.value(2).toString();
	record.transcript_preview = query.value(3).toString();
	record.call_type = query.value(4).toString();
	record.summary = query.value(5).toString();
	record.sentiment = query.value(6).toString();
	record.analysis = QJsonDocument::fromJson(query.value(7).toString().toUtf8()).object();
	record.processing_seconds = query.value(8).toDouble();
	record.model_used = query.value(9).toString();
	record.error_message = query.value(10).toString();
	record.created_at = query.value(11).toString();
	record.updated_at = query.value(12).toString();
	return record;
}

bool SummaryStore::upsert_summary(const SummaryRecord &record, QString *error)
{
	ConnectionGuard guard(next_connection_name());
	QSqlDatabase db;
	if (!connection(guard.name(), &db, error))
		return false;

	QSqlQuery update(db);
	update.prepare("UPDATE call_summaries SET recording_file = ?, language_detected = ?, transcript_preview = ?, "
		       "call_type = ?, summary = ?, sentiment = ?, analysis_json = ?, processing_time_seconds = ?, "
		       "model_used = ?, error_message = ?, updated_at = ? WHERE call_id = ?");
	update.addBindValue(nullable(record.recording_ref));
	update.addBindValue(nullable(record.language));
	update.addBindValue(nullable(record.transcript_preview));
	update.addBindValue(nullable(record.call_type));
	update.addBindValue(nullable(record.summary));
	update.addBindValue(nullable(record.sentiment));
	update.addBindValue(QString::fromUtf8(QJsonDocument(record.analysis).toJson(QJsonDocument::Compact)));
	update.addBindValue(record.processing_seconds);
	update.addBindValue(nullable(record.model_used));
	update.addBindValue(nullable(record.error_message));
	update.addBindValue(utc_now_iso());
	update.addBindValue(record.call_id);
	if (!update.exec()) {
		set_error(error, update.lastError().text());
		return false;
	}
	if (update.numRowsAffected() > 0)
		return true;

	bool raced = false;
	if (insert_row(db, record, &raced, error))
		return true;
	if (!raced)
		return false;

	// Another thread inserted the row between our update and insert.
	if (!update.exec()) {
		set_error(error, update.lastError().text());
		return false;
	}
	return true;
}

bool SummaryStore::save_error(const QString &call_id, const QString &error_message, const QString &recording_ref,
			      QString *error)
{
	ConnectionGuard guard(next_connection_name());
	QSqlDatabase db;
	if (!connection(guard.name(), &db, error))
		return false;

	QSqlQuery update(db);
	update.prepare("UPDATE call_summaries SET error_message = ?, updated_at = ? WHERE call_id = ?");
	update.addBindValue(error_message);
	update.addBindValue(utc_now_iso());
	update.addBindValue(call_id);
	if (!update.exec()) {
		set_error(error, update.lastError().text());
		return false;
	}
	if (update.numRowsAffected() > 0)
		return true;

	SummaryRecord record;
	record.call_id = call_id;
	record.recording_ref = recording_ref;
	record.error_message = error_message;
	bool raced = false;
	if (insert_row(db, record, &raced, error))
		return true;
	if (!raced)
		return false;

	if (!update.exec()) {
		set_error(error, update.lastError().text());
		return false;
	}
	return true;
}

bool SummaryStore::insert_row(QSqlDatabase &db, const SummaryRecord &record, bool *raced, QString *error)
{
	*raced = false;
	const QString now = utc_now_iso();
	QSqlQuery insert(db);
	insert.prepare("INSERT INTO call_summaries (call_id, recording_file, language_detected, transcript_preview, "
		       "call_type, summary, sentiment, analysis_json, processing_time_seconds, model_used, "
		       "error_message, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
	insert.addBindValue(record.call_id);
	insert.addBindValue(nullable(record.recording_ref));
	insert.addBindValue(nullable(record.language));
	insert.addBindValue(nullable(record.transcript_preview));
	insert.addBindValue(nullable(record.call_type));
	insert.addBindValue(nullable(record.summary));
	insert.addBindValue(nullable(record.sentiment));
	insert.addBindValue(QString::fromUtf8(QJsonDocument(record.analysis).toJson(QJsonDocument::Compact)));
	insert.addBindValue(record.processing_seconds);
	insert.addBindValue(nullable(record.model_used));
	insert.addBindValue(nullable(record.error_message));
	insert.addBindValue(now);
	insert.addBindValue(now);
	if (insert.exec())
		return true;

	if (is_unique_violation(insert.lastError())) {
		qCDebug(cs_log, "[store] summary for %s inserted concurrently", qUtf8Printable(record.call_id));
		*raced = true;
		return false;
	}

	set_error(error, insert.lastError().text());
	return false;
}

QString SummaryStore::next_connection_name()
{
	return QString("%1-%2").arg(m_connection_prefix).arg(m_next_connection.fetch_add(1));
}

bool SummaryStore::connection(const QString &name, QSqlDatabase *out_db, QString *error)
{
	*out_db = QSqlDatabase::addDatabase("QSQLITE", name);
	out_db->setDatabaseName(m_sqlite_path);
	out_db->setConnectOptions("QSQLITE_BUSY_TIMEOUT=5000");
	if (!out_db->open()) {
		set_error(error, QString("Failed to open %1: %2").arg(m_sqlite_path, out_db->lastError().text()));
		return false;
	}
	return true;
}

} // namespace cs

#include "cs-summary-store.hpp"

#include <QJsonArray>
#include <QSqlDatabase>
#include <QTemporaryDir>
#include <QThread>

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Store test failed: " << message << std::endl;
	std::exit(1);
}

cs::SummaryRecord analyzed_record(const QString &call_id)
{
	cs::SummaryRecord record;
	record.call_id = call_id;
	record.recording_ref = "20251211160749-1765454864.23722-201-0556195159-Outbound.wav";
	record.language = "en";
	record.transcript_preview = "Hello, I am calling about...";
	record.call_type = "inquiry";
	record.summary = "Customer asked about documents.";
	record.sentiment = "positive";
	record.analysis.insert("call_type", "inquiry");
	record.analysis.insert("topics_discussed", QJsonArray({"visa", "documents"}));
	record.processing_seconds = 12.5;
	record.model_used = "llama3.1:8b";
	return record;
}

void test_error_then_summary()
{
	QTemporaryDir temp_dir;
	require(temp_dir.isValid(), "temporary directory created");
	cs::SummaryStore store(temp_dir.filePath("db/summaries.db"));
	QString error;
	require(store.open(&error), "store opens and creates its directory");

	require(!store.has_completed_summary("call-1"), "unknown call has no summary");
	require(!store.find("call-1"), "unknown call not found");

	require(store.save_error("call-1", "No recording available for this call", QString(), &error), "save error");
	require(!store.has_completed_summary("call-1"), "error row is not a completed summary");
	std::optional<cs::SummaryRecord> found = store.find("call-1");
	require(found && found->error_message == "No recording available for this call", "error persisted");
	require(!found->created_at.isEmpty(), "created timestamp set");

	require(store.upsert_summary(analyzed_record("call-1"), &error), "upsert over error row");
	require(store.has_completed_summary("call-1"), "summary now completed");
	found = store.find("call-1");
	require(found && found->error_message.isEmpty(), "error cleared by successful upsert");
	require(found->sentiment == "positive", "sentiment stored");
	require(found->analysis.value("topics_discussed").toArray().size() == 2, "analysis json stored");
	require(found->processing_seconds > 12.0, "processing time stored");

	require(store.save_error("call-1", "reprocess failed", QString(), &error), "save error over summary");
	found = store.find("call-1");
	require(found && found->summary == "Customer asked about documents.", "error keeps the previous summary");
	require(!store.has_completed_summary("call-1"), "errored row no longer counts as completed");

	const QJsonObject json = cs::summary_record_to_json(*found);
	require(json.value("error_message").toString() == "reprocess failed", "json error message");
	require(json.value("call_id").toString() == "call-1", "json call id");
}

void test_concurrent_upserts_from_threads()
{
	QTemporaryDir temp_dir;
	require(temp_dir.isValid(), "temporary directory created");
	cs::SummaryStore store(temp_dir.filePath("summaries.db"));
	QString error;
	require(store.open(&error), "store opens");

	std::atomic<int> failures{0};
	std::vector<std::unique_ptr<QThread>> threads;
	for (int i = 0; i < 4; ++i) {
		threads.emplace_back(QThread::create([&store, &failures]() {
			QString thread_error;
			if (!store.upsert_summary(analyzed_record("call-race"), &thread_error))
				failures.fetch_add(1);
			if (!store.has_completed_summary("call-race"))
				failures.fetch_add(1);
		}));
		threads.back()->start();
	}
	for (auto &thread : threads)
		require(thread->wait(10000), "writer thread finished");

	require(failures.load() == 0, "racing inserts are not errors");
	require(store.has_completed_summary("call-race"), "summary visible from the main thread");
}

void test_connections_released_by_short_lived_threads()
{
	QTemporaryDir temp_dir;
	require(temp_dir.isValid(), "temporary directory created");
	cs::SummaryStore store(temp_dir.filePath("summaries.db"));
	QString error;
	require(store.open(&error), "store opens");
	require(store.upsert_summary(analyzed_record("call-seen"), &error), "seed summary");

	const int baseline = static_cast<int>(QSqlDatabase::connectionNames().size());
	std::atomic<int> misses{0};
	for (int i = 0; i < 40; ++i) {
		std::unique_ptr<QThread> thread(QThread::create([&store, &misses]() {
			if (!store.has_completed_summary("call-seen"))
				misses.fetch_add(1);
		}));
		thread->start();
		require(thread->wait(10000), "reader thread finished");
	}

	require(misses.load() == 0, "every thread sees the summary");
	require(static_cast<int>(QSqlDatabase::connectionNames().size()) == baseline,
		"no connection outlives the operation that opened it");
	require(store.has_completed_summary("call-seen"), "main thread still reads");
	require(static_cast<int>(QSqlDatabase::connectionNames().size()) == baseline, "main thread leaves none behind");
}

} // namespace

void run_store_tests()
{
	test_error_then_summary();
	test_concurrent_upserts_from_threads();
	test_connections_released_by_short_lived_threads();
}

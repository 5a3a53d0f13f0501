#pragma once

#include "cs-analysis-backend.hpp"
#include "cs-pbx-client.hpp"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QStringList>
#include <QThread>
#include <QTimer>
#include <QUrl>

#include <atomic>
#include <functional>
#include <mutex>

namespace cs_test {

// Spins the calling thread's event loop until the predicate holds.
inline bool wait_until(const std::function<bool()> &predicate, int timeout_ms = 5000)
{
	QElapsedTimer timer;
	timer.start();
	while (!predicate()) {
		if (timer.elapsed() > timeout_ms)
			return false;
		QEventLoop loop;
		QTimer::singleShot(5, &loop, &QEventLoop::quit);
		loop.exec();
	}
	return true;
}

inline void spin_for(int ms)
{
	QEventLoop loop;
	QTimer::singleShot(ms, &loop, &QEventLoop::quit);
	loop.exec();
}

inline QJsonObject cdr_record(const QString &uid, const QString &call_type, const QString &disposition,
			      const QString &recording)
{
	QJsonObject cdr;
	cdr.insert("uid", uid);
	cdr.insert("call_type", call_type);
	cdr.insert("disposition", disposition);
	if (!recording.isEmpty())
		cdr.insert("recording", recording);
	return cdr;
}

// Serves CDR and recording pages from memory and resolves every recording to
// one local audio file.
class FakePbxClient : public cs::PbxClient {
public:
	QJsonArray cdrs;
	QJsonArray recordings;
	QString audio_path;
	bool fail_requests = false;
	std::atomic<int> cdr_page_requests{0};
	std::atomic<int> recording_page_requests{0};

	bool fetch_cdr_page(int page, int page_size, QJsonArray *out_records, QString *error) override
	{
		cdr_page_requests.fetch_add(1);
		return slice(cdrs, page, page_size, out_records, error);
	}

	bool fetch_recording_page(int page, int page_size, QJsonArray *out_records, QString *error) override
	{
		recording_page_requests.fetch_add(1);
		return slice(recordings, page, page_size, out_records, error);
	}

	bool resolve_download_url(const QString &recording_ref, QUrl *out_url, QString *error) override
	{
		if (fail_requests || recording_ref.startsWith("missing")) {
			*error = "Recording file not available";
			return false;
		}
		*out_url = QUrl::fromLocalFile(audio_path);
		return true;
	}

private:
	bool slice(const QJsonArray &source, int page, int page_size, QJsonArray *out_records, QString *error)
	{
		if (fail_requests) {
			*error = "PBX unreachable";
			return false;
		}
		out_records->clear();
		const int begin = (page - 1) * page_size;
		for (int i = begin; i < source.size() && i < begin + page_size; ++i)
			out_records->push_back(source.at(i));
		return true;
	}
};

// Returns a fixed transcript and analysis and records how many inference calls
// overlap.
class FakeAnalysisBackend : public cs::AnalysisBackend {
public:
	QString transcript = "Hello, I am calling about my visa renewal appointment. Could you please help me "
			     "understand which documents I need to bring tomorrow?";
	QString failure;
	int delay_ms = 0;
	std::atomic<int> transcribe_calls{0};
	std::atomic<int> analyze_calls{0};
	std::atomic<int> active{0};
	std::atomic<int> max_active{0};

	bool transcribe(const QString &audio_path, cs::Transcription *out, QString *error) override
	{
		enter();
		transcribe_calls.fetch_add(1);
		const bool readable = QFile::exists(audio_path);
		leave();
		if (!failure.isEmpty()) {
			*error = failure;
			return false;
		}
		if (!readable) {
			*error = "audio file missing";
			return false;
		}
		out->text = transcript;
		out->language = "en";
		return true;
	}

	bool analyze(const QString &, const QString &context, cs::Analysis *out, QString *error) override
	{
		enter();
		analyze_calls.fetch_add(1);
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			last_context = context;
		}
		leave();
		if (!failure.isEmpty()) {
			*error = failure;
			return false;
		}
		out->data.insert("call_type", "inquiry");
		out->data.insert("summary", "Customer asked which documents to bring for a visa renewal.");
		out->data.insert("mood_sentiment_analysis", QJsonObject{{"overall_sentiment", "positive"}});
		out->model_used = "fake-model";
		return true;
	}

	QString context() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return last_context;
	}

private:
	void enter()
	{
		const int now = active.fetch_add(1) + 1;
		int seen = max_active.load();
		while (now > seen && !max_active.compare_exchange_weak(seen, now)) {
		}
		if (delay_ms > 0)
			QThread::msleep(static_cast<unsigned long>(delay_ms));
	}

	void leave() { active.fetch_sub(1); }

	mutable std::mutex m_mutex;
	QString last_context;
};

inline QString write_fake_audio(const QString &dir_path)
{
	const QString path = dir_path + "/source-audio.wav";
	QFile file(path);
	if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		file.write(QByteArray(2048, '\x01'));
		file.close();
	}
	return path;
}

} // namespace cs_test

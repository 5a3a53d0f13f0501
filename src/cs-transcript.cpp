#include "cs-transcript.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QSet>
#include <QStringList>

namespace cs {
namespace {

constexpr int kMinTranscriptChars = 20;
constexpr int kMinMeaningfulWords = 5;
constexpr int kMinDistinctWords = 3;
constexpr int kConversationalWordThreshold = 15;
constexpr int kPreviewChars = 500;

bool matches_whole(const QString &pattern, const QString &text)
{
	const QRegularExpression re(QRegularExpression::anchoredPattern(pattern),
				    QRegularExpression::CaseInsensitiveOption);
	return re.match(text).hasMatch();
}

bool is_noise_only(const QString &text_lower)
{
	static const char *const patterns[] = {
		R"([\s\.,!\?\-]+)",
		R"((ring|ringing|beep|tone|music|silence|noise|static|hum|buzz|click)+[\s,\.]*)",
		R"((uh|um|hmm|ah|oh|eh|er)+[\s,\.]*)",
		R"((hello|hi|hey|bye|goodbye|thank you|thanks|okay|ok|yes|no|yeah|yep|nope)[\s,\.!\?]*)",
	};
	for (const char *pattern : patterns) {
		if (matches_whole(QString::fromLatin1(pattern), text_lower))
			return true;
	}
	return false;
}

bool has_conversational_marker(const QString &text_lower)
{
	static const QRegularExpression markers(
		R"(\b(what|how|when|where|why|who|can|could|would|should|is|are|do|does|have|has|please|need|want|)"
		R"(help|service|appointment|document|yes|no|okay|sure|right|correct|understand|sir|madam|call|)"
		R"(calling|phone|number|contact|thank|thanks|welcome|sorry|excuse)\b)");
	return markers.match(text_lower).hasMatch();
}

QString extract_string_field(const QString &text, const QString &field)
{
	const QRegularExpression re(QString(R"("%1"\s*:\s*"((?:[^"\\]|\\.)*)")").arg(field));
	const QRegularExpressionMatch match = re.match(text);
	if (!match.hasMatch())
		return QString();
	QString value = match.captured(1);
	value.replace("\\\"", "\"");
	value.replace("\\n", " ");
	return value;
}

QJsonObject extract_fields(const QString &text)
{
	QJsonObject result;
	for (const char *field : {"call_type", "summary", "sentiment"}) {
		const QString value = extract_string_field(text, QString::fromLatin1(field));
		if (!value.isEmpty())
			result.insert(QString::fromLatin1(field), value);
	}
	for (const char *field : {"staff_name", "customer_name"}) {
		const QString value = extract_string_field(text, QString::fromLatin1(field));
		if (!value.isEmpty() && value.compare("null", Qt::CaseInsensitive) != 0 &&
		    value.compare("none", Qt::CaseInsensitive) != 0)
			result.insert(QString::fromLatin1(field), value);
	}

	static const QRegularExpression quoted(R"("([^"]*)")");
	for (const char *field : {"topics_discussed", "action_items", "customer_requests", "staff_responses"}) {
		const QRegularExpression array_re(QString(R"("%1"\s*:\s*\[(.*?)\])").arg(QString::fromLatin1(field)),
						  QRegularExpression::DotMatchesEverythingOption);
		const QRegularExpressionMatch match = array_re.match(text);
		if (!match.hasMatch())
			continue;
		QJsonArray items;
		QRegularExpressionMatchIterator it = quoted.globalMatch(match.captured(1));
		while (it.hasNext())
			items.push_back(it.next().captured(1));
		if (!items.isEmpty())
			result.insert(QString::fromLatin1(field), items);
	}

	if (!result.contains("summary")) {
		result.insert("summary", "Summary could not be parsed from AI response");
		result.insert("error", "JSON parsing failed - fields extracted manually");
	}
	return result;
}

} // namespace

TranscriptCheck validate_transcript(const QString &transcript)
{
	const QString cleaned = transcript.trimmed();
	if (cleaned.isEmpty())
		return {false, "Empty transcript"};
	if (cleaned.size() < kMinTranscriptChars)
		return {false, "Transcript too short"};

	// Speaker labels and timestamps are bracketed.
	QString text_only = cleaned;
	text_only.remove(QRegularExpression(R"(\[.*?\]:?)"));
	text_only = text_only.trimmed();

	static const QRegularExpression letter("[A-Za-z]");
	QStringList words;
	for (const QString &word : text_only.split(QRegularExpression(R"(\s+)"), Qt::SkipEmptyParts)) {
		if (word.size() >= 2 && word.contains(letter))
			words.push_back(word);
	}
	if (words.size() < kMinMeaningfulWords)
		return {false, QString("Insufficient content (%1 words)").arg(words.size())};

	const QString text_lower = text_only.toLower();
	if (is_noise_only(text_lower))
		return {false, "Transcript contains only noise or minimal interaction"};

	QSet<QString> distinct;
	for (const QString &word : words) {
		if (word.size() >= 3)
			distinct.insert(word.toLower());
	}
	if (distinct.size() < kMinDistinctWords)
		return {false, "Transcript contains repetitive non-conversational content"};

	if (words.size() < kConversationalWordThreshold && !has_conversational_marker(text_lower))
		return {false, "Transcript lacks conversational content"};

	return {true, "Valid transcript"};
}

QString RecordingContext::to_prompt_text() const
{
	QStringList lines;
	if (!staff_extension.isEmpty())
		lines.push_back(QString("Extension: %1").arg(staff_extension));
	if (call_direction == "outbound")
		lines.push_back("Call Direction: Outbound (Staff initiated the call)");
	else if (call_direction == "inbound")
		lines.push_back("Call Direction: Inbound (Customer called in)");
	else if (call_direction == "internal")
		lines.push_back("Call Direction: Internal (Call between staff members)");
	return lines.isEmpty() ? QString("No additional context available.") : lines.join('\n');
}

RecordingContext recording_context_from_file_name(const QString &file_name)
{
	RecordingContext context;
	static const QRegularExpression extension_re(R"(-(\d{3})-)");
	const QRegularExpressionMatch match = extension_re.match(file_name);
	if (match.hasMatch())
		context.staff_extension = match.captured(1);

	if (file_name.contains("outbound", Qt::CaseInsensitive))
		context.call_direction = "outbound";
	else if (file_name.contains("inbound", Qt::CaseInsensitive))
		context.call_direction = "inbound";
	else if (file_name.contains("internal", Qt::CaseInsensitive))
		context.call_direction = "internal";
	return context;
}

QJsonObject parse_llm_response(const QString &response_text)
{
	const int start = response_text.indexOf('{');
	const int end = response_text.lastIndexOf('}');
	if (start >= 0 && end > start) {
		QString json_text = response_text.mid(start, end - start + 1);
		json_text.replace(QRegularExpression(R"(,\s*([\]}]))"), "\\1");
		json_text.remove(QRegularExpression("[\\x00-\\x1f\\x7f-\\x9f]"));

		QJsonParseError parse_error;
		const QJsonDocument doc = QJsonDocument::fromJson(json_text.toUtf8(), &parse_error);
		if (parse_error.error == QJsonParseError::NoError && doc.isObject())
			return doc.object();
	}
	return extract_fields(response_text);
}

QString transcript_preview(const QString &transcript)
{
	if (transcript.size() <= kPreviewChars)
		return transcript;
	return transcript.left(kPreviewChars) + "...";
}

QString sentiment_from_analysis(const QJsonObject &analysis)
{
	const QString direct = analysis.value("sentiment").toString();
	if (!direct.isEmpty())
		return direct;
	return analysis.value("mood_sentiment_analysis").toObject().value("overall_sentiment").toString();
}

} // namespace cs

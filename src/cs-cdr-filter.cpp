#include "cs-cdr-filter.hpp"

#include <initializer_list>

namespace cs {
namespace {

QString first_string(const QJsonObject &cdr, std::initializer_list<const char *> keys)
{
	for (const char *key : keys) {
		const QJsonValue value = cdr.value(QString::fromLatin1(key));
		QString text;
		if (value.isString())
			text = value.toString();
		else if (value.isDouble())
			text = QString::number(value.toDouble(), 'f', 0);
		if (!text.isEmpty())
			return text;
	}
	return QString();
}

QString call_type_of(const QJsonObject &cdr)
{
	const QString call_type = first_string(cdr, {"call_type", "calltype", "type"}).toLower();
	if (!call_type.isEmpty())
		return call_type;
	if (cdr.value("outbound").toString() == "yes")
		return "outbound";
	if (cdr.value("internal").toString() == "yes")
		return "internal";
	if (cdr.contains("callid"))
		return "inbound";
	return QString();
}

bool skip(QString *skip_reason, const QString &reason)
{
	if (skip_reason)
		*skip_reason = reason;
	return false;
}

} // namespace

bool cdr_candidate(const QJsonObject &cdr, bool process_internal_calls, CdrCandidate *out_candidate,
		   QString *skip_reason)
{
	CdrCandidate candidate;
	candidate.call_id = first_string(cdr, {"uid", "callid"});
	if (candidate.call_id.isEmpty())
		return skip(skip_reason, "missing call id");

	candidate.call_type = call_type_of(cdr);
	const bool internal_allowed = process_internal_calls && candidate.call_type == "internal";
	if (candidate.call_type != "inbound" && candidate.call_type != "outbound" && !internal_allowed)
		return skip(skip_reason, QString("call type '%1'").arg(candidate.call_type));

	const QString disposition = first_string(cdr, {"disposition", "status"}).toUpper();
	if (disposition != "ANSWERED")
		return skip(skip_reason, QString("disposition '%1'").arg(disposition));

	candidate.recording_ref = first_string(cdr, {"recording", "record_file", "recordingfile"});
	if (candidate.recording_ref.isEmpty())
		return skip(skip_reason, "no recording");

	*out_candidate = candidate;
	return true;
}

} // namespace cs

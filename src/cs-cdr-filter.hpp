#pragma once

#include <QJsonObject>
#include <QString>

namespace cs {

struct CdrCandidate {
	QString call_id;
	QString recording_ref;
	QString call_type;
};

// Accepts answered inbound/outbound calls that carry a recording. Field names
// cover both the cloud CDR list and the on-premise webhook payloads.
bool cdr_candidate(const QJsonObject &cdr, bool process_internal_calls, CdrCandidate *out_candidate,
		   QString *skip_reason = nullptr);

} // namespace cs

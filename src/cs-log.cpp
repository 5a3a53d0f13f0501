#include "cs-log.hpp"

#include <QtGlobal>

Q_LOGGING_CATEGORY(cs_log, "callscribe")

namespace cs {

void install_log_format(bool verbose)
{
	qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} - %{category} - "
			   "%{if-debug}DEBUG%{endif}%{if-info}INFO%{endif}%{if-warning}WARNING%{endif}"
			   "%{if-critical}CRITICAL%{endif}%{if-fatal}FATAL%{endif} - %{message}");
	QLoggingCategory::setFilterRules(verbose ? QStringLiteral("callscribe.debug=true")
						 : QStringLiteral("callscribe.debug=false"));
}

} // namespace cs

#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(cs_log)

namespace cs {

void install_log_format(bool verbose);

} // namespace cs

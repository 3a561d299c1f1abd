#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(sb_timeline)
Q_DECLARE_LOGGING_CATEGORY(sb_io)

namespace sb {

// Enables debug output for every sb.* category when verbose is set.
void set_verbose_logging(bool verbose);

} // namespace sb

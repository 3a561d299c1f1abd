#include "sb-logging.hpp"

Q_LOGGING_CATEGORY(sb_timeline, "sb.timeline", QtInfoMsg)
Q_LOGGING_CATEGORY(sb_io, "sb.io", QtInfoMsg)

namespace sb {

void set_verbose_logging(bool verbose)
{
	if (verbose)
		QLoggingCategory::setFilterRules("sb.*.debug=true");
	else
		QLoggingCategory::setFilterRules("sb.*.debug=false");
}

} // namespace sb

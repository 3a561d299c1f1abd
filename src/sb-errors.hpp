#pragma once

#include <QString>

namespace sb {

enum class TimelineErrorCode {
	MalformedTimestamp,
	NoSegments,
	InvalidSplitCount,
	InvalidAssetPath,
	InvalidInput,
	IoFailure,
};

struct TimelineError {
	TimelineErrorCode code = TimelineErrorCode::InvalidInput;
	QString message;
};

inline const char *timeline_error_code_name(TimelineErrorCode code)
{
	switch (code) {
	case TimelineErrorCode::MalformedTimestamp:
		return "malformed_timestamp";
	case TimelineErrorCode::NoSegments:
		return "no_segments";
	case TimelineErrorCode::InvalidSplitCount:
		return "invalid_split_count";
	case TimelineErrorCode::InvalidAssetPath:
		return "invalid_asset_path";
	case TimelineErrorCode::InvalidInput:
		return "invalid_input";
	case TimelineErrorCode::IoFailure:
		return "io_failure";
	default:
		return "unknown";
	}
}

inline void set_error(TimelineError *error, TimelineErrorCode code, const QString &message)
{
	if (!error)
		return;
	error->code = code;
	error->message = message;
}

} // namespace sb

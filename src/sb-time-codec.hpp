#pragma once

#include "sb-errors.hpp"

#include <QString>

#include <cstdint>
#include <optional>

namespace sb {

inline constexpr int default_frame_rate()
{
	return 24;
}

class TimeCodec {
public:
	// Accepts HH:MM:SS,mmm or HH:MM:SS.mmm; the fraction may have one to three digits or be omitted.
	static std::optional<double> parse_timestamp(const QString &text, TimelineError *error = nullptr);
	static QString format_timestamp(double seconds);

	static int64_t seconds_to_frame(double seconds, int fps = default_frame_rate());
	static double round_to_millisecond(double seconds);
};

} // namespace sb

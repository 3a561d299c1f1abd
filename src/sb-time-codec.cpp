#include "sb-time-codec.hpp"

#include <QRegularExpression>

#include <cmath>

namespace sb {
namespace {

const QRegularExpression &timestamp_pattern()
{
	static const QRegularExpression pattern(QStringLiteral("^(\\d{2}):(\\d{2}):(\\d{2})(?:[,.](\\d{1,3}))?$"));
	return pattern;
}

int64_t seconds_to_milliseconds(double seconds)
{
	if (!(seconds > 0.0))
		return 0;
	return std::llround(seconds * 1000.0);
}

} // namespace

std::optional<double> TimeCodec::parse_timestamp(const QString &text, TimelineError *error)
{
	const QRegularExpressionMatch match = timestamp_pattern().match(text.trimmed());
	if (!match.hasMatch()) {
		set_error(error, TimelineErrorCode::MalformedTimestamp, QString("Malformed timestamp: '%1'").arg(text));
		return std::nullopt;
	}

	const int64_t hours = match.captured(1).toLongLong();
	const int64_t minutes = match.captured(2).toLongLong();
	const int64_t seconds = match.captured(3).toLongLong();

	// "5" is half a second, not five milliseconds.
	int64_t millis = 0;
	const QString fraction = match.captured(4);
	if (!fraction.isEmpty())
		millis = fraction.leftJustified(3, '0').toLongLong();

	const int64_t total_ms = ((hours * 60 + minutes) * 60 + seconds) * 1000 + millis;
	return static_cast<double>(total_ms) / 1000.0;
}

QString TimeCodec::format_timestamp(double seconds)
{
	const int64_t total_ms = seconds_to_milliseconds(seconds);
	const int64_t millis = total_ms % 1000;
	const int64_t total_seconds = total_ms / 1000;
	const int64_t secs = total_seconds % 60;
	const int64_t minutes = (total_seconds / 60) % 60;
	const int64_t hours = total_seconds / 3600;

	return QString("%1:%2:%3,%4")
		.arg(hours, 2, 10, QChar('0'))
		.arg(minutes, 2, 10, QChar('0'))
		.arg(secs, 2, 10, QChar('0'))
		.arg(millis, 3, 10, QChar('0'));
}

int64_t TimeCodec::seconds_to_frame(double seconds, int fps)
{
	if (fps <= 0)
		fps = default_frame_rate();
	return static_cast<int64_t>(std::floor(seconds * fps));
}

double TimeCodec::round_to_millisecond(double seconds)
{
	return static_cast<double>(std::llround(seconds * 1000.0)) / 1000.0;
}

} // namespace sb

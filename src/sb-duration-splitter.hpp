#pragma once

#include "sb-errors.hpp"
#include "sb-timeline-data.hpp"

#include <QStringList>
#include <QVector>

#include <optional>

namespace sb {

inline constexpr double default_split_seconds()
{
	return 3.0;
}

class DurationSplitter {
public:
	explicit DurationSplitter(double split_seconds = default_split_seconds());

	double split_seconds() const;

	// Number of sub-intervals a span of this duration asks for, never below one.
	int split_count_for_duration(double duration_seconds) const;

	// Partitions the segment's span and text. The last split always ends exactly at the segment end.
	std::optional<QVector<TextSplit>> split_segment(const TextSegment &segment, TimelineError *error = nullptr) const;

	// Divides a span into count equal parts with millisecond boundaries; the last part keeps the original end.
	static std::optional<QVector<TimeSpan>> divide_span(const TimeSpan &span, int count,
							     TimelineError *error = nullptr);

	static QStringList split_text_into_chunks(const QString &text, int chunk_count);
	static QStringList split_into_sentences(const QString &text);

private:
	double m_split_seconds;
};

} // namespace sb

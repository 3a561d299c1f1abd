#include "sb-timeline-report.hpp"

#include "sb-time-codec.hpp"

#include <QFileInfo>
#include <QTextStream>

#include <algorithm>
#include <cmath>

namespace sb {
namespace {

double round_to_hundredths(double value)
{
	return std::round(value * 100.0) / 100.0;
}

} // namespace

SplitStatistics compute_split_statistics(const QVector<TextSplit> &splits)
{
	SplitStatistics stats;
	if (splits.isEmpty())
		return stats;

	double total_duration = 0.0;
	for (const TextSplit &split : splits) {
		total_duration += split.span.duration();
		stats.total_keywords += static_cast<int>(split.keywords.size());
	}

	stats.total_splits = static_cast<int>(splits.size());
	stats.total_duration = round_to_hundredths(total_duration);
	stats.average_duration = round_to_hundredths(total_duration / stats.total_splits);
	stats.average_keywords = round_to_hundredths(static_cast<double>(stats.total_keywords) / stats.total_splits);
	return stats;
}

QString format_split_statistics(const SplitStatistics &stats, int segment_count)
{
	QString text;
	QTextStream stream(&text);
	stream << "Statistics:\n";
	stream << "  Original segments: " << segment_count << "\n";
	stream << "  Text splits created: " << stats.total_splits << "\n";
	stream << "  Total duration: " << QString::number(stats.total_duration, 'f', 2) << "s\n";
	stream << "  Average split duration: " << QString::number(stats.average_duration, 'f', 2) << "s\n";
	stream << "  Keywords: " << stats.total_keywords << " (" << QString::number(stats.average_keywords, 'f', 2)
	       << " per split)\n";
	if (segment_count > 0)
		stream << "  Average splits per segment: "
		       << QString::number(static_cast<double>(stats.total_splits) / segment_count, 'f', 1) << "\n";
	stream.flush();
	return text;
}

QString format_timeline_preview(const QVector<TimelineEntry> &entries, int max_items)
{
	QString text;
	QTextStream stream(&text);
	const int shown = std::min<int>(std::max(0, max_items), entries.size());

	stream << "Timeline preview (showing first " << shown << " of " << entries.size() << " entries):\n";
	for (int i = 0; i < shown; ++i) {
		const TimelineEntry &entry = entries.at(i);
		stream << "\nEntry " << (i + 1) << ":\n";
		stream << "  Time: " << TimeCodec::format_timestamp(entry.span.start_seconds) << " -> "
		       << TimeCodec::format_timestamp(entry.span.end_seconds) << " ("
		       << QString::number(entry.span.duration(), 'f', 1) << "s)\n";
		stream << "  Images: " << entry.image_paths.size() << "\n";
		for (const QString &image_path : entry.image_paths)
			stream << "    - " << QFileInfo(image_path).fileName() << "\n";
	}

	if (entries.size() > shown)
		stream << "\n... and " << (entries.size() - shown) << " more entries\n";

	stream.flush();
	return text;
}

} // namespace sb

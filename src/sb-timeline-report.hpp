#pragma once

#include "sb-timeline-data.hpp"

#include <QString>
#include <QVector>

namespace sb {

struct SplitStatistics {
	int total_splits = 0;
	double total_duration = 0.0;
	double average_duration = 0.0;
	int total_keywords = 0;
	double average_keywords = 0.0;
};

// Durations and averages are rounded to two decimals.
SplitStatistics compute_split_statistics(const QVector<TextSplit> &splits);

QString format_split_statistics(const SplitStatistics &stats, int segment_count);
QString format_timeline_preview(const QVector<TimelineEntry> &entries, int max_items = 10);

} // namespace sb

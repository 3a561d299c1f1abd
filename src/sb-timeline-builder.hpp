#pragma once

#include "sb-clip-scheduler.hpp"
#include "sb-duration-splitter.hpp"
#include "sb-errors.hpp"
#include "sb-fcpxml-writer.hpp"
#include "sb-models.hpp"
#include "sb-timeline-data.hpp"

#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace sb {

struct ExportArtifacts {
	QString timeline_path;
	QString fcpxml_path;
	ScheduleReport report;
	QStringList omitted_assets;
};

class TimelineBuilder {
public:
	explicit TimelineBuilder(const ExportSettings &settings = ExportSettings());

	const ExportSettings &settings() const;

	// Entries with malformed timestamps are skipped and listed in skipped. Segment indices follow input order.
	std::optional<QVector<TextSegment>> segments_from_subtitles(const QVector<SubtitleEntry> &subtitles,
								    TimelineError *error = nullptr,
								    QStringList *skipped = nullptr) const;
	std::optional<QVector<TextSplit>> split_segments(const QVector<TextSegment> &segments,
							 TimelineError *error = nullptr) const;
	std::optional<QVector<TextSplit>> split_subtitles(const QVector<SubtitleEntry> &subtitles,
							  TimelineError *error = nullptr) const;

	// One entry per split, in split order. Splits without an assignment get no images.
	static QVector<TimelineEntry> assign_images(const QVector<TextSplit> &splits, const ImageAssignments &assignments);

	FcpxmlDocumentInput build_document_input(const QVector<TimelineEntry> &entries, const QString &title,
						 ScheduleReport *report = nullptr, QStringList *omitted_assets = nullptr) const;

	// Writes <title>_timeline.json and <title>_timeline.fcpxml into output_dir. When the FCPXML cannot be
	// written the JSON timeline is removed again.
	bool export_timeline(const QVector<TimelineEntry> &entries, const QString &title, const QString &output_dir,
			     ExportArtifacts *artifacts, TimelineError *error = nullptr) const;

private:
	ExportSettings m_settings;
	DurationSplitter m_splitter;
	ClipScheduler m_scheduler;
};

} // namespace sb

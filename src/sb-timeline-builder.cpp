#include "sb-timeline-builder.hpp"

#include "sb-asset-registry.hpp"
#include "sb-logging.hpp"
#include "sb-time-codec.hpp"
#include "sb-timeline-json.hpp"

#include <QFile>

namespace sb {

TimelineBuilder::TimelineBuilder(const ExportSettings &settings)
	: m_settings(settings),
	  m_splitter(settings.split_seconds),
	  m_scheduler(settings.frame_rate, settings.gap_threshold_frames)
{
}

const ExportSettings &TimelineBuilder::settings() const
{
	return m_settings;
}

std::optional<QVector<TextSegment>> TimelineBuilder::segments_from_subtitles(const QVector<SubtitleEntry> &subtitles,
									     TimelineError *error,
									     QStringList *skipped) const
{
	if (subtitles.isEmpty()) {
		set_error(error, TimelineErrorCode::NoSegments, "No subtitle entries to build a timeline from");
		return std::nullopt;
	}

	QVector<TextSegment> segments;
	segments.reserve(subtitles.size());
	for (int i = 0; i < subtitles.size(); ++i) {
		const SubtitleEntry &subtitle = subtitles.at(i);

		TimelineError timestamp_error;
		const std::optional<double> start = TimeCodec::parse_timestamp(subtitle.start_timestamp, &timestamp_error);
		const std::optional<double> end =
			start ? TimeCodec::parse_timestamp(subtitle.end_timestamp, &timestamp_error) : std::nullopt;
		if (!start || !end) {
			qCWarning(sb_timeline, "[srt-storyboard] skipping subtitle %d: %s", subtitle.index,
				  qUtf8Printable(timestamp_error.message));
			if (skipped)
				skipped->push_back(timestamp_error.message);
			continue;
		}

		TextSegment segment;
		segment.text = subtitle.text;
		segment.span = {*start, *end};
		segment.segment_index = i;
		segments.push_back(segment);
	}

	if (segments.isEmpty()) {
		set_error(error, TimelineErrorCode::NoSegments, "No subtitle entry has valid timestamps");
		return std::nullopt;
	}
	return segments;
}

std::optional<QVector<TextSplit>> TimelineBuilder::split_segments(const QVector<TextSegment> &segments,
								  TimelineError *error) const
{
	if (segments.isEmpty()) {
		set_error(error, TimelineErrorCode::NoSegments, "No segments to split");
		return std::nullopt;
	}

	QVector<TextSplit> splits;
	for (const TextSegment &segment : segments) {
		TimelineError split_error;
		const std::optional<QVector<TextSplit>> segment_splits = m_splitter.split_segment(segment, &split_error);
		if (segment_splits) {
			splits += *segment_splits;
			continue;
		}

		if (split_error.code == TimelineErrorCode::InvalidSplitCount) {
			if (error)
				*error = split_error;
			return std::nullopt;
		}
		qCWarning(sb_timeline, "[srt-storyboard] skipping segment %d: %s", segment.segment_index,
			  qUtf8Printable(split_error.message));
	}

	if (splits.isEmpty()) {
		set_error(error, TimelineErrorCode::NoSegments, "No segment produced a usable split");
		return std::nullopt;
	}

	qCInfo(sb_timeline, "[srt-storyboard] %lld segments split into %lld sub-intervals",
	       static_cast<long long>(segments.size()), static_cast<long long>(splits.size()));
	return splits;
}

std::optional<QVector<TextSplit>> TimelineBuilder::split_subtitles(const QVector<SubtitleEntry> &subtitles,
								   TimelineError *error) const
{
	const std::optional<QVector<TextSegment>> segments = segments_from_subtitles(subtitles, error);
	if (!segments)
		return std::nullopt;
	return split_segments(*segments, error);
}

QVector<TimelineEntry> TimelineBuilder::assign_images(const QVector<TextSplit> &splits,
						      const ImageAssignments &assignments)
{
	QVector<TimelineEntry> entries;
	entries.reserve(splits.size());
	for (const TextSplit &split : splits) {
		TimelineEntry entry;
		entry.span = split.span;
		entry.image_paths = assignments.value({split.segment_index, split.split_index});
		entries.push_back(entry);
	}
	return entries;
}

FcpxmlDocumentInput TimelineBuilder::build_document_input(const QVector<TimelineEntry> &entries, const QString &title,
							   ScheduleReport *report, QStringList *omitted_assets) const
{
	AssetRegistry registry;
	registry.register_entries(entries, omitted_assets);

	FcpxmlDocumentInput input;
	input.title = title;
	input.project_name = m_settings.project_name;
	input.assets = registry.resources();
	input.spine = m_scheduler.schedule(entries, registry, report);
	input.fps = m_scheduler.fps();
	input.width = m_settings.width;
	input.height = m_settings.height;
	input.version = m_settings.fcpxml_version;
	if (!entries.isEmpty())
		input.sequence_duration_frames = TimeCodec::seconds_to_frame(entries.last().span.end_seconds, input.fps);
	return input;
}

bool TimelineBuilder::export_timeline(const QVector<TimelineEntry> &entries, const QString &title,
				      const QString &output_dir, ExportArtifacts *artifacts, TimelineError *error) const
{
	if (entries.isEmpty()) {
		set_error(error, TimelineErrorCode::NoSegments, "Timeline has no entries to export");
		return false;
	}

	ExportArtifacts result;
	result.timeline_path = timeline_artifact_path(output_dir, title);
	result.fcpxml_path = FcpxmlWriter::artifact_path_for_title(output_dir, title);

	const FcpxmlDocumentInput input = build_document_input(entries, title, &result.report, &result.omitted_assets);

	QString io_error;
	if (!write_timeline_file(result.timeline_path, entries, &io_error)) {
		set_error(error, TimelineErrorCode::IoFailure, io_error);
		return false;
	}

	// Both artifacts or neither.
	const FcpxmlWriter writer;
	if (!writer.write_document(result.fcpxml_path, input, &io_error)) {
		if (!QFile::remove(result.timeline_path))
			qCWarning(sb_io, "[srt-storyboard] failed to remove %s", qUtf8Printable(result.timeline_path));
		set_error(error, TimelineErrorCode::IoFailure, io_error);
		return false;
	}

	qCInfo(sb_io, "[srt-storyboard] timeline saved to %s (%lld entries)", qUtf8Printable(result.timeline_path),
	       static_cast<long long>(entries.size()));
	qCInfo(sb_io, "[srt-storyboard] FCPXML saved to %s (%lld assets, %lld omitted)",
	       qUtf8Printable(result.fcpxml_path), static_cast<long long>(input.assets.size()),
	       static_cast<long long>(result.omitted_assets.size()));

	if (artifacts)
		*artifacts = result;
	return true;
}

} // namespace sb

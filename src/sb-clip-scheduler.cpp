#include "sb-clip-scheduler.hpp"

#include "sb-logging.hpp"

#include <algorithm>
#include <optional>

namespace sb {

ClipScheduler::ClipScheduler(int fps, int64_t gap_threshold_frames)
	: m_fps(fps > 0 ? fps : default_frame_rate()),
	  m_gap_threshold_frames(gap_threshold_frames >= 0 ? gap_threshold_frames : default_gap_threshold_frames())
{
}

int ClipScheduler::fps() const
{
	return m_fps;
}

int64_t ClipScheduler::gap_threshold_frames() const
{
	return m_gap_threshold_frames;
}

QVector<Clip> ClipScheduler::materialize_clips(const QVector<TimelineEntry> &entries, const AssetRegistry &registry)
{
	QVector<Clip> clips;
	for (const TimelineEntry &entry : entries) {
		if (entry.image_paths.isEmpty())
			continue;

		const double image_duration = entry.span.duration() / entry.image_paths.size();
		for (int i = 0; i < entry.image_paths.size(); ++i) {
			const QString &image_path = entry.image_paths.at(i);
			const QString asset_id = registry.asset_id_for(image_path);
			if (asset_id.isEmpty())
				continue;

			Clip clip;
			clip.span.start_seconds = entry.span.start_seconds + i * image_duration;
			clip.span.end_seconds = clip.span.start_seconds + image_duration;
			clip.image_path = image_path;
			clip.asset_id = asset_id;
			clips.push_back(clip);
		}
	}
	return clips;
}

QVector<Clip> ClipScheduler::resolve_overlaps(QVector<Clip> clips, ScheduleReport *report)
{
	std::stable_sort(clips.begin(), clips.end(),
			 [](const Clip &lhs, const Clip &rhs) { return lhs.span.end_seconds < rhs.span.end_seconds; });

	QVector<Clip> resolved;
	resolved.reserve(clips.size());
	std::optional<int> last_kept;

	for (Clip clip : clips) {
		if (!clip.span.is_valid()) {
			qCDebug(sb_timeline, "[srt-storyboard] dropped clip '%s': no duration", qUtf8Printable(clip.image_path));
			if (report)
				report->clips_dropped += 1;
			continue;
		}

		if (last_kept) {
			const double previous_end = resolved.at(*last_kept).span.end_seconds;
			if (clip.span.start_seconds < previous_end) {
				clip.span.start_seconds = std::max(clip.span.start_seconds, previous_end);
				if (clip.span.start_seconds >= clip.span.end_seconds) {
					qCDebug(sb_timeline, "[srt-storyboard] dropped clip '%s': fully covered by previous clip",
						qUtf8Printable(clip.image_path));
					if (report)
						report->clips_dropped += 1;
					continue;
				}
				if (report)
					report->clips_trimmed += 1;
			}
		}

		resolved.push_back(clip);
		last_kept = static_cast<int>(resolved.size()) - 1;
	}

	return resolved;
}

QVector<FrameClip> ClipScheduler::quantize(const QVector<Clip> &clips) const
{
	QVector<FrameClip> frame_clips;
	frame_clips.reserve(clips.size());
	for (const Clip &clip : clips) {
		FrameClip frame_clip;
		frame_clip.start_frame = TimeCodec::seconds_to_frame(clip.span.start_seconds, m_fps);
		frame_clip.end_frame = TimeCodec::seconds_to_frame(clip.span.end_seconds, m_fps);
		frame_clip.asset_id = clip.asset_id;
		frame_clip.clip_name = AssetRegistry::display_name_for_path(clip.image_path);
		frame_clips.push_back(frame_clip);
	}
	return frame_clips;
}

int ClipScheduler::bridge_small_gaps(QVector<FrameClip> &frame_clips) const
{
	int bridged = 0;
	for (int i = 1; i < frame_clips.size(); ++i) {
		FrameClip &previous = frame_clips[i - 1];
		const FrameClip &current = frame_clips.at(i);

		// The +1 keeps the inclusive end-frame convention of the exported documents.
		const int64_t gap = current.start_frame - previous.end_frame + 1;
		if (gap > 0 && gap <= m_gap_threshold_frames) {
			if (previous.end_frame != current.start_frame) {
				qCDebug(sb_timeline, "[srt-storyboard] extending clip '%s' by %lld frames to close a gap",
					qUtf8Printable(previous.clip_name), static_cast<long long>(gap));
				bridged += 1;
			}
			previous.end_frame = current.start_frame;
		} else if (gap > 0) {
			qCDebug(sb_timeline, "[srt-storyboard] keeping gap of %lld frames before '%s'",
				static_cast<long long>(gap), qUtf8Printable(current.clip_name));
		}
	}
	return bridged;
}

QVector<SpineElement> ClipScheduler::build_spine(const QVector<FrameClip> &frame_clips)
{
	QVector<SpineElement> spine;
	int64_t cursor = 0;

	for (const FrameClip &clip : frame_clips) {
		if (clip.start_frame > cursor) {
			SpineElement gap;
			gap.kind = SpineElement::Kind::Gap;
			gap.offset_frames = cursor;
			gap.duration_frames = clip.start_frame - cursor;
			gap.name = QStringLiteral("Gap");
			spine.push_back(gap);
			cursor = clip.start_frame;
		}

		SpineElement video;
		video.kind = SpineElement::Kind::Video;
		video.offset_frames = cursor;
		video.duration_frames = clip.end_frame - clip.start_frame + 1;
		video.asset_id = clip.asset_id;
		video.name = clip.clip_name;
		spine.push_back(video);
		cursor += video.duration_frames;
	}

	return spine;
}

QVector<SpineElement> ClipScheduler::schedule(const QVector<TimelineEntry> &entries, const AssetRegistry &registry,
					      ScheduleReport *report) const
{
	const QVector<Clip> clips = materialize_clips(entries, registry);
	const QVector<Clip> resolved = resolve_overlaps(clips, report);
	qCInfo(sb_timeline, "[srt-storyboard] %lld clips after overlap resolution (%lld materialized)",
	       static_cast<long long>(resolved.size()), static_cast<long long>(clips.size()));

	QVector<FrameClip> frame_clips = quantize(resolved);
	const int bridged = bridge_small_gaps(frame_clips);
	const QVector<SpineElement> spine = build_spine(frame_clips);

	if (report) {
		report->clips_materialized = static_cast<int>(clips.size());
		report->gaps_bridged = bridged;
		report->gap_elements = static_cast<int>(std::count_if(spine.begin(), spine.end(), [](const SpineElement &e) {
			return e.kind == SpineElement::Kind::Gap;
		}));
	}
	return spine;
}

} // namespace sb

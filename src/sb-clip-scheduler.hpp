#pragma once

#include "sb-asset-registry.hpp"
#include "sb-time-codec.hpp"
#include "sb-timeline-data.hpp"

#include <QVector>

#include <cstdint>

namespace sb {

inline constexpr int64_t default_gap_threshold_frames()
{
	return 12;
}

struct ScheduleReport {
	int clips_materialized = 0;
	int clips_dropped = 0;
	int clips_trimmed = 0;
	int gaps_bridged = 0;
	int gap_elements = 0;
};

class ClipScheduler {
public:
	explicit ClipScheduler(int fps = default_frame_rate(), int64_t gap_threshold_frames = default_gap_threshold_frames());

	int fps() const;
	int64_t gap_threshold_frames() const;

	// Splits every entry's span evenly among its images. Images unknown to the registry produce no clip.
	static QVector<Clip> materialize_clips(const QVector<TimelineEntry> &entries, const AssetRegistry &registry);

	// Stable-sorts by end time, trims each clip's start to the end of the last kept clip and drops clips
	// left without duration. The result is ordered and non-overlapping.
	static QVector<Clip> resolve_overlaps(QVector<Clip> clips, ScheduleReport *report = nullptr);

	QVector<FrameClip> quantize(const QVector<Clip> &clips) const;

	// Extends a clip up to the next clip's start frame when start - end + 1 lies in (0, threshold].
	int bridge_small_gaps(QVector<FrameClip> &frame_clips) const;

	// Emits video and gap elements back to back from frame zero.
	static QVector<SpineElement> build_spine(const QVector<FrameClip> &frame_clips);

	// Full pass: materialize, resolve, quantize, bridge, lay out.
	QVector<SpineElement> schedule(const QVector<TimelineEntry> &entries, const AssetRegistry &registry,
				       ScheduleReport *report = nullptr) const;

private:
	int m_fps;
	int64_t m_gap_threshold_frames;
};

} // namespace sb

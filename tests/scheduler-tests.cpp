#include "sb-asset-registry.hpp"
#include "sb-clip-scheduler.hpp"

#include <cstdlib>
#include <iostream>

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Scheduler test failed: " << message << std::endl;
	std::exit(1);
}

sb::TimelineEntry make_entry(double start, double end, const QStringList &images)
{
	sb::TimelineEntry entry;
	entry.span = {start, end};
	entry.image_paths = images;
	return entry;
}

sb::Clip make_clip(double start, double end, const QString &image_path)
{
	sb::Clip clip;
	clip.span = {start, end};
	clip.image_path = image_path;
	clip.asset_id = image_path;
	return clip;
}

sb::FrameClip make_frame_clip(int64_t start, int64_t end, const QString &name)
{
	sb::FrameClip clip;
	clip.start_frame = start;
	clip.end_frame = end;
	clip.asset_id = "r-" + name;
	clip.clip_name = name;
	return clip;
}

int count_gaps(const QVector<sb::SpineElement> &spine)
{
	int gaps = 0;
	for (const sb::SpineElement &element : spine) {
		if (element.kind == sb::SpineElement::Kind::Gap)
			gaps += 1;
	}
	return gaps;
}

void test_materialize_divides_entries_among_images()
{
	const QVector<sb::TimelineEntry> entries = {
		make_entry(0.0, 3.0, {"/img/a.jpg", "/img/b.jpg"}),
		make_entry(3.0, 5.0, {}),
		make_entry(5.0, 6.0, {"/img/a.jpg"}),
	};

	sb::AssetRegistry registry;
	registry.register_entries(entries);
	require(registry.resources().size() == 2, "one asset per distinct image");
	require(registry.asset_id_for("/img/a.jpg") == "r1", "first image gets r1");
	require(registry.asset_id_for("/img/b.jpg") == "r2", "second image gets r2");

	const QVector<sb::Clip> clips = sb::ClipScheduler::materialize_clips(entries, registry);
	require(clips.size() == 3, "entries without images produce no clips");
	require(clips.at(0).span.start_seconds == 0.0 && clips.at(0).span.end_seconds == 1.5, "first image half");
	require(clips.at(1).span.start_seconds == 1.5 && clips.at(1).span.end_seconds == 3.0, "second image half");
	require(clips.at(1).asset_id == "r2", "clip references its asset");
	require(clips.at(2).asset_id == "r1", "shared image reuses its asset");
}

void test_overlapping_entry_is_trimmed()
{
	const QVector<sb::TimelineEntry> entries = {
		make_entry(0.0, 3.0, {"/img/a.jpg"}),
		make_entry(2.5, 5.0, {"/img/b.jpg"}),
	};

	sb::AssetRegistry registry;
	registry.register_entries(entries);
	sb::ScheduleReport report;
	const QVector<sb::Clip> resolved =
		sb::ClipScheduler::resolve_overlaps(sb::ClipScheduler::materialize_clips(entries, registry), &report);

	require(resolved.size() == 2, "both clips survive");
	require(resolved.at(0).span.start_seconds == 0.0 && resolved.at(0).span.end_seconds == 3.0, "first clip [0,3)");
	require(resolved.at(1).span.start_seconds == 3.0 && resolved.at(1).span.end_seconds == 5.0, "second clip [3,5)");
	require(report.clips_trimmed == 1 && report.clips_dropped == 0, "one trim reported");
}

void test_overlap_sorting_uses_end_time()
{
	const QVector<sb::Clip> resolved =
		sb::ClipScheduler::resolve_overlaps({make_clip(0.0, 5.0, "long"), make_clip(1.0, 4.0, "inner")});
	require(resolved.size() == 2, "earlier-ending clip is processed first");
	require(resolved.at(0).image_path == "inner", "inner clip leads");
	require(resolved.at(1).span.start_seconds == 4.0 && resolved.at(1).span.end_seconds == 5.0,
		"long clip trimmed to what remains after the inner clip");
}

void test_fully_covered_clip_is_dropped()
{
	sb::ScheduleReport report;
	const QVector<sb::Clip> resolved =
		sb::ClipScheduler::resolve_overlaps({make_clip(0.0, 5.0, "first"), make_clip(2.0, 5.0, "second")}, &report);
	require(resolved.size() == 1, "clip ending with its predecessor is dropped");
	require(resolved.first().image_path == "first", "stable order keeps the first clip");
	require(report.clips_dropped == 1, "drop reported");
}

void test_trim_compares_against_last_kept_clip()
{
	const QVector<sb::Clip> resolved = sb::ClipScheduler::resolve_overlaps(
		{make_clip(0.0, 4.0, "kept"), make_clip(3.0, 4.0, "dropped"), make_clip(3.5, 6.0, "trimmed")});
	require(resolved.size() == 2, "middle clip dropped");
	require(resolved.at(1).image_path == "trimmed", "third clip kept");
	require(resolved.at(1).span.start_seconds == 4.0, "third clip trimmed against the last kept clip");
}

void test_clips_without_duration_are_dropped()
{
	sb::ScheduleReport report;
	require(sb::ClipScheduler::resolve_overlaps({make_clip(5.0, 4.0, "backwards")}, &report).isEmpty(),
		"lone backwards clip dropped");
	require(report.clips_dropped == 1, "backwards drop reported");

	const QVector<sb::Clip> resolved = sb::ClipScheduler::resolve_overlaps(
		{make_clip(5.0, 4.0, "backwards"), make_clip(0.0, 2.0, "a"), make_clip(2.0, 2.0, "empty"),
		 make_clip(2.0, 3.0, "b")});
	require(resolved.size() == 2, "only clips with duration kept");
	require(resolved.at(0).image_path == "a" && resolved.at(1).image_path == "b", "valid clips in order");

	const QVector<sb::TimelineEntry> entries = {
		make_entry(5.0, 4.0, {"/img/backwards.jpg"}),
		make_entry(6.0, 8.0, {"/img/a.jpg"}),
	};
	sb::AssetRegistry registry;
	registry.register_entries(entries);
	const QVector<sb::SpineElement> spine = sb::ClipScheduler(24).schedule(entries, registry);
	require(spine.size() == 2, "leading gap and one video");
	for (const sb::SpineElement &element : spine)
		require(element.duration_frames > 0, "no element without duration");
	require(spine.at(1).offset_frames == 144 && spine.at(1).duration_frames == 49, "valid clip keeps its place");
}

void test_resolved_clips_never_overlap()
{
	QVector<sb::Clip> clips;
	uint32_t state = 12345;
	for (int i = 0; i < 200; ++i) {
		state = state * 1103515245u + 12345u;
		const double start = static_cast<double>((state >> 8) % 6000) / 100.0;
		state = state * 1103515245u + 12345u;
		const double length = 0.01 + static_cast<double>((state >> 8) % 500) / 100.0;
		clips.push_back(make_clip(start, start + length, QString::number(i)));
	}

	const QVector<sb::Clip> resolved = sb::ClipScheduler::resolve_overlaps(clips);
	require(!resolved.isEmpty(), "resolution keeps clips");
	for (int i = 0; i < resolved.size(); ++i) {
		require(resolved.at(i).span.is_valid(), "every kept clip has a duration");
		if (i == 0)
			continue;
		require(resolved.at(i - 1).span.end_seconds <= resolved.at(i).span.start_seconds, "no overlaps");
		require(resolved.at(i - 1).span.start_seconds <= resolved.at(i).span.start_seconds, "sorted by start");
	}
}

void test_quantize_truncates_to_frames()
{
	const sb::ClipScheduler scheduler(24);
	const QVector<sb::FrameClip> frames =
		scheduler.quantize({make_clip(0.0, 3.0, "/img/seg000_split0_apple_1.jpg"), make_clip(3.0, 5.01, "/img/b.png")});
	require(frames.size() == 2, "one frame clip per clip");
	require(frames.at(0).start_frame == 0 && frames.at(0).end_frame == 72, "first clip frames");
	require(frames.at(1).start_frame == 72 && frames.at(1).end_frame == 120, "end frame truncated");
	require(frames.at(0).clip_name == "seg000_split0_apple_1", "clip name is the file stem");
}

void test_small_gap_is_bridged()
{
	const sb::ClipScheduler scheduler(24);
	QVector<sb::FrameClip> frames = {make_frame_clip(0, 48, "a"), make_frame_clip(52, 100, "b")};
	require(scheduler.bridge_small_gaps(frames) == 1, "five frame gap bridged");
	require(frames.at(0).end_frame == 52, "previous clip extended to the next start");

	const QVector<sb::SpineElement> spine = sb::ClipScheduler::build_spine(frames);
	require(count_gaps(spine) == 0, "no gap element between bridged clips");
	require(spine.size() == 2, "two video elements");
	require(spine.at(0).offset_frames == 0 && spine.at(0).duration_frames == 53, "extended clip duration");
	require(spine.at(1).offset_frames == 53 && spine.at(1).duration_frames == 49, "next clip follows the cursor");
}

void test_gap_threshold_boundaries()
{
	const sb::ClipScheduler scheduler(24);

	QVector<sb::FrameClip> at_threshold = {make_frame_clip(0, 24, "a"), make_frame_clip(35, 60, "b")};
	require(scheduler.bridge_small_gaps(at_threshold) == 1, "twelve frame gap bridged");
	require(count_gaps(sb::ClipScheduler::build_spine(at_threshold)) == 0, "twelve frame gap leaves no element");

	QVector<sb::FrameClip> over_threshold = {make_frame_clip(0, 24, "a"), make_frame_clip(36, 60, "b")};
	require(scheduler.bridge_small_gaps(over_threshold) == 0, "thirteen frame gap kept");
	require(over_threshold.at(0).end_frame == 24, "previous clip unchanged");
	const QVector<sb::SpineElement> spine = sb::ClipScheduler::build_spine(over_threshold);
	require(count_gaps(spine) == 1, "kept gap is emitted");
	require(spine.at(1).offset_frames == 25 && spine.at(1).duration_frames == 11, "gap fills up to the next clip");

	QVector<sb::FrameClip> adjacent = {make_frame_clip(0, 72, "a"), make_frame_clip(72, 120, "b")};
	require(scheduler.bridge_small_gaps(adjacent) == 0, "adjacent clips need no bridging");
	require(adjacent.at(0).end_frame == 72, "adjacent clip unchanged");

	QVector<sb::FrameClip> overlapping = {make_frame_clip(0, 72, "a"), make_frame_clip(70, 120, "b")};
	require(scheduler.bridge_small_gaps(overlapping) == 0, "overlap after quantization is left alone");
	require(overlapping.at(0).end_frame == 72, "overlapping clip unchanged");

	const sb::ClipScheduler no_bridging(24, 0);
	require(no_bridging.gap_threshold_frames() == 0, "zero threshold kept");
	require(sb::ClipScheduler(0, -1).fps() == 24, "invalid rate falls back");
	require(sb::ClipScheduler(0, -1).gap_threshold_frames() == 12, "negative threshold falls back");
	QVector<sb::FrameClip> unbridged = {make_frame_clip(0, 48, "a"), make_frame_clip(52, 100, "b")};
	require(no_bridging.bridge_small_gaps(unbridged) == 0, "zero threshold disables bridging");
}

void test_large_gap_durations_add_up()
{
	const QVector<sb::SpineElement> spine = sb::ClipScheduler::build_spine(
		{make_frame_clip(48, 72, "a"), make_frame_clip(200, 240, "b")});
	require(spine.size() == 4, "leading gap, clip, gap, clip");
	require(spine.at(0).kind == sb::SpineElement::Kind::Gap && spine.at(0).duration_frames == 48, "leading gap");
	require(spine.at(0).name == "Gap", "gap elements are named Gap");

	int64_t total = 0;
	for (const sb::SpineElement &element : spine) {
		require(element.offset_frames == total, "elements are back to back");
		total += element.duration_frames;
	}
	require(total == 241, "durations cover the timeline through the last inclusive frame");
}

void test_full_schedule()
{
	const QVector<sb::TimelineEntry> entries = {
		make_entry(0.0, 3.0, {"/img/a.jpg"}),
		make_entry(3.0, 5.0, {"/img/b.jpg"}),
		make_entry(5.0, 10.0, {}),
		make_entry(10.0, 12.0, {"/img/c.jpg"}),
	};

	sb::AssetRegistry registry;
	registry.register_entries(entries);
	const sb::ClipScheduler scheduler(24);
	sb::ScheduleReport report;
	const QVector<sb::SpineElement> spine = scheduler.schedule(entries, registry, &report);

	require(report.clips_materialized == 3, "three clips materialized");
	require(report.gap_elements == 1, "the empty entry becomes one gap");
	require(spine.size() == 4, "video, video, gap, video");
	require(spine.at(0).duration_frames == 73 && spine.at(1).offset_frames == 73, "inclusive end frames");
	require(spine.at(2).kind == sb::SpineElement::Kind::Gap, "gap before the last clip");
	require(spine.at(2).offset_frames == 122 && spine.at(2).duration_frames == 118, "gap up to frame 240");
	require(spine.at(3).asset_id == "r3" && spine.at(3).offset_frames == 240, "last clip at ten seconds");
}

} // namespace

int main()
{
	test_materialize_divides_entries_among_images();
	test_overlapping_entry_is_trimmed();
	test_overlap_sorting_uses_end_time();
	test_fully_covered_clip_is_dropped();
	test_trim_compares_against_last_kept_clip();
	test_clips_without_duration_are_dropped();
	test_resolved_clips_never_overlap();
	test_quantize_truncates_to_frames();
	test_small_gap_is_bridged();
	test_gap_threshold_boundaries();
	test_large_gap_durations_add_up();
	test_full_schedule();
	return 0;
}

#pragma once

#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <cstdint>

namespace sb {

struct TimeSpan {
	double start_seconds = 0.0;
	double end_seconds = 0.0;

	double duration() const { return end_seconds - start_seconds; }
	bool is_valid() const { return end_seconds > start_seconds; }
};

// One subtitle block as delivered by the parser; timestamps are still text.
struct SubtitleEntry {
	int index = 0;
	QString start_timestamp;
	QString end_timestamp;
	QString text;
};

struct TextSegment {
	QString text;
	TimeSpan span;
	int segment_index = 0;
};

struct TextSplit {
	QString text;
	TimeSpan span;
	QStringList keywords;
	int segment_index = 0;
	int split_index = 0;
};

struct TimelineEntry {
	TimeSpan span;
	QStringList image_paths;
};

struct Clip {
	TimeSpan span;
	QString image_path;
	QString asset_id;
};

// end_frame is inclusive: a clip occupies [start_frame, end_frame].
struct FrameClip {
	int64_t start_frame = 0;
	int64_t end_frame = 0;
	QString asset_id;
	QString clip_name;
};

struct AssetResource {
	QString asset_id;
	QString image_path;
	QString name;
	QString src;
};

struct SpineElement {
	enum class Kind {
		Video,
		Gap,
	};

	Kind kind = Kind::Video;
	int64_t offset_frames = 0;
	int64_t duration_frames = 0;
	QString asset_id;
	QString name;
};

struct SplitKey {
	int segment_index = 0;
	int split_index = 0;
};

inline bool operator<(const SplitKey &lhs, const SplitKey &rhs)
{
	if (lhs.segment_index != rhs.segment_index)
		return lhs.segment_index < rhs.segment_index;
	return lhs.split_index < rhs.split_index;
}

inline bool operator==(const SplitKey &lhs, const SplitKey &rhs)
{
	return lhs.segment_index == rhs.segment_index && lhs.split_index == rhs.split_index;
}

using ImageAssignments = QMap<SplitKey, QStringList>;

} // namespace sb

#pragma once

#include "sb-errors.hpp"
#include "sb-timeline-builder.hpp"
#include "sb-timeline-data.hpp"

#include <QDateTime>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <map>
#include <memory>

namespace sb {

// Interactive timeline state: the splits of one subtitle file and the images picked for each split.
struct TimelineSession {
	QString id;
	QDateTime created_at;
	QString video_title;
	QVector<TextSplit> splits;
	QMap<int, QStringList> selections;

	// Replaces the splits and clears every selection.
	bool load_subtitles(const QVector<SubtitleEntry> &subtitles, const QString &title, const TimelineBuilder &builder,
			    TimelineError *error = nullptr);
	bool select_images(int split_position, const QStringList &image_paths);
	QVector<TimelineEntry> timeline_entries() const;
};

class SessionStore {
public:
	TimelineSession &create_session();
	TimelineSession *find_session(const QString &session_id);
	const TimelineSession *find_session(const QString &session_id) const;
	bool remove_session(const QString &session_id);

	// Removes sessions created before now - max_age_secs and returns how many were dropped.
	int evict_older_than(qint64 max_age_secs, const QDateTime &now = QDateTime::currentDateTimeUtc());

	int session_count() const;

private:
	std::map<QString, std::unique_ptr<TimelineSession>> m_sessions;
};

} // namespace sb

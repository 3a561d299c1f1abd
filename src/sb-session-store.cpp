#include "sb-session-store.hpp"

#include "sb-logging.hpp"

#include <QUuid>

namespace sb {

bool TimelineSession::load_subtitles(const QVector<SubtitleEntry> &subtitles, const QString &title,
				     const TimelineBuilder &builder, TimelineError *error)
{
	const std::optional<QVector<TextSplit>> new_splits = builder.split_subtitles(subtitles, error);
	if (!new_splits)
		return false;

	video_title = title;
	splits = *new_splits;
	selections.clear();
	return true;
}

bool TimelineSession::select_images(int split_position, const QStringList &image_paths)
{
	if (split_position < 0 || split_position >= splits.size())
		return false;

	if (image_paths.isEmpty())
		selections.remove(split_position);
	else
		selections.insert(split_position, image_paths);
	return true;
}

QVector<TimelineEntry> TimelineSession::timeline_entries() const
{
	QVector<TimelineEntry> entries;
	entries.reserve(splits.size());
	for (int i = 0; i < splits.size(); ++i) {
		TimelineEntry entry;
		entry.span = splits.at(i).span;
		entry.image_paths = selections.value(i);
		entries.push_back(entry);
	}
	return entries;
}

TimelineSession &SessionStore::create_session()
{
	auto session = std::make_unique<TimelineSession>();
	session->id = QUuid::createUuid().toString(QUuid::WithoutBraces);
	session->created_at = QDateTime::currentDateTimeUtc();

	TimelineSession &ref = *session;
	m_sessions[session->id] = std::move(session);
	qCDebug(sb_timeline, "[srt-storyboard] session %s created", qUtf8Printable(ref.id));
	return ref;
}

TimelineSession *SessionStore::find_session(const QString &session_id)
{
	const auto found = m_sessions.find(session_id);
	return found == m_sessions.end() ? nullptr : found->second.get();
}

const TimelineSession *SessionStore::find_session(const QString &session_id) const
{
	const auto found = m_sessions.find(session_id);
	return found == m_sessions.end() ? nullptr : found->second.get();
}

bool SessionStore::remove_session(const QString &session_id)
{
	return m_sessions.erase(session_id) > 0;
}

int SessionStore::evict_older_than(qint64 max_age_secs, const QDateTime &now)
{
	const QDateTime cutoff = now.addSecs(-max_age_secs);
	int evicted = 0;
	for (auto it = m_sessions.begin(); it != m_sessions.end();) {
		if (it->second->created_at < cutoff) {
			it = m_sessions.erase(it);
			evicted += 1;
		} else {
			++it;
		}
	}

	if (evicted > 0)
		qCInfo(sb_timeline, "[srt-storyboard] evicted %d expired sessions", evicted);
	return evicted;
}

int SessionStore::session_count() const
{
	return static_cast<int>(m_sessions.size());
}

} // namespace sb

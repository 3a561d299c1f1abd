#include "sb-srt-parser.hpp"

#include "sb-logging.hpp"

#include <QFile>
#include <QRegularExpression>
#include <QStringConverter>

namespace sb {
namespace {

const QRegularExpression &block_separator()
{
	static const QRegularExpression pattern(QStringLiteral("\\n\\s*\\n"));
	return pattern;
}

const QRegularExpression &timing_pattern()
{
	static const QRegularExpression pattern(QStringLiteral("^(\\S+)\\s*-->\\s*(\\S+)"));
	return pattern;
}

} // namespace

QVector<SubtitleEntry> SrtParser::parse_content(const QString &content) const
{
	m_skipped_blocks = 0;

	QString normalized = content;
	if (normalized.startsWith(QChar(0xFEFF)))
		normalized.remove(0, 1);
	normalized.replace("\r\n", "\n");
	normalized.replace('\r', '\n');

	QVector<SubtitleEntry> entries;
	const QStringList blocks = normalized.trimmed().split(block_separator(), Qt::SkipEmptyParts);
	for (const QString &block : blocks) {
		const QStringList lines = block.trimmed().split('\n');
		if (lines.size() < 3) {
			m_skipped_blocks += 1;
			qCWarning(sb_io, "[srt-storyboard] skipping subtitle block with %lld lines",
				  static_cast<long long>(lines.size()));
			continue;
		}

		bool index_ok = false;
		const int index = lines.at(0).trimmed().toInt(&index_ok);
		const QRegularExpressionMatch timing = timing_pattern().match(lines.at(1).trimmed());
		if (!index_ok || !timing.hasMatch()) {
			m_skipped_blocks += 1;
			qCWarning(sb_io, "[srt-storyboard] skipping malformed subtitle block '%s'",
				  qUtf8Printable(lines.at(0).trimmed()));
			continue;
		}

		SubtitleEntry entry;
		entry.index = index;
		entry.start_timestamp = timing.captured(1);
		entry.end_timestamp = timing.captured(2);
		entry.text = lines.mid(2).join('\n').trimmed();
		entries.push_back(entry);
	}

	qCInfo(sb_io, "[srt-storyboard] parsed %lld subtitle entries (%d skipped)", static_cast<long long>(entries.size()),
	       m_skipped_blocks);
	return entries;
}

bool SrtParser::parse_file(const QString &path, QVector<SubtitleEntry> *entries, QString *error) const
{
	QFile file(path);
	if (!file.exists()) {
		if (error)
			*error = QString("SRT file not found: %1").arg(path);
		return false;
	}
	if (!file.open(QIODevice::ReadOnly)) {
		if (error)
			*error = QString("Failed to open SRT file: %1").arg(path);
		return false;
	}

	*entries = parse_content(QString::fromUtf8(file.readAll()));
	return true;
}

int SrtParser::skipped_blocks() const
{
	return m_skipped_blocks;
}

} // namespace sb

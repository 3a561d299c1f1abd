#pragma once

#include "sb-timeline-data.hpp"

#include <QString>
#include <QVector>

namespace sb {

class SrtParser {
public:
	// Blocks need an index line, a "start --> end" line and at least one text line; anything else is
	// skipped with a warning. Timestamps are returned verbatim for the builder to validate.
	QVector<SubtitleEntry> parse_content(const QString &content) const;
	bool parse_file(const QString &path, QVector<SubtitleEntry> *entries, QString *error) const;

	int skipped_blocks() const;

private:
	mutable int m_skipped_blocks = 0;
};

} // namespace sb

#pragma once

#include <QString>
#include <QStringList>

namespace sb {

// Strips markup tags and symbols (keeping . , ! ? -) and splits on whitespace.
QStringList tokenize_words(const QString &text);

// Lower-cased tokens without punctuation, longer than two characters, no stopwords, first-seen order.
QStringList extract_keywords(const QString &text);

bool is_stopword(const QString &word);

// Ranked image-search queries for a split's keywords, at most five.
QStringList generate_search_queries(const QStringList &keywords);

} // namespace sb

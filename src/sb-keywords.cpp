#include "sb-keywords.hpp"

#include <QRegularExpression>
#include <QSet>

#include <algorithm>

namespace sb {
namespace {

const QSet<QString> &stopwords()
{
	static const QSet<QString> words = {
		"a",        "about",    "above",   "after",      "again",   "against", "ain",     "all",     "am",
		"among",    "an",       "and",     "any",        "are",     "aren",    "as",      "at",      "be",
		"because",  "been",     "before",  "being",      "below",   "between", "both",    "but",     "by",
		"can",      "could",    "couldn",  "d",          "did",     "didn",    "do",      "does",    "doesn",
		"doing",    "don",      "down",    "during",     "each",    "few",     "for",     "from",    "further",
		"had",      "hadn",     "has",     "hasn",       "have",    "haven",   "having",  "he",      "her",
		"here",     "hers",     "herself", "him",        "himself", "his",     "how",     "i",       "if",
		"in",       "into",     "is",      "isn",        "it",      "its",     "itself",  "just",    "ll",
		"m",        "ma",       "may",     "me",         "might",   "mightn",  "more",    "most",    "must",
		"mustn",    "my",       "myself",  "needn",      "no",      "nor",     "not",     "now",     "o",
		"of",       "off",      "on",      "once",       "only",    "or",      "other",   "our",     "ours",
		"ourselves", "out",     "over",    "own",        "re",      "s",       "same",    "shan",    "she",
		"should",   "shouldn",  "so",      "some",       "such",    "t",       "than",    "that",    "the",
		"their",    "theirs",   "them",    "themselves", "then",    "there",   "these",   "they",    "this",
		"those",    "through",  "to",      "too",        "under",   "until",   "up",      "us",      "ve",
		"very",     "was",      "wasn",    "we",         "were",    "weren",   "what",    "when",    "where",
		"which",    "while",    "who",     "whom",       "why",     "will",    "with",    "won",     "would",
		"wouldn",   "y",        "you",     "your",       "yours",   "yourself", "yourselves",
	};
	return words;
}

const QRegularExpression &markup_pattern()
{
	static const QRegularExpression pattern(QStringLiteral("<[^>]+>"));
	return pattern;
}

const QRegularExpression &symbol_pattern()
{
	static const QRegularExpression pattern(QStringLiteral("[^\\w\\s.,!?-]"),
						QRegularExpression::UseUnicodePropertiesOption);
	return pattern;
}

const QRegularExpression &non_word_pattern()
{
	static const QRegularExpression pattern(QStringLiteral("[^\\w]"), QRegularExpression::UseUnicodePropertiesOption);
	return pattern;
}

} // namespace

QStringList tokenize_words(const QString &text)
{
	QString clean = text;
	clean.remove(markup_pattern());
	clean.replace(symbol_pattern(), QStringLiteral(" "));
	return clean.split(QRegularExpression(QStringLiteral("\\s+")), Qt::SkipEmptyParts);
}

QStringList extract_keywords(const QString &text)
{
	QStringList keywords;
	for (QString word : tokenize_words(text.toLower())) {
		word.remove(non_word_pattern());
		if (word.size() <= 2 || is_stopword(word))
			continue;
		if (!keywords.contains(word))
			keywords.push_back(word);
	}
	return keywords;
}

bool is_stopword(const QString &word)
{
	return stopwords().contains(word);
}

QStringList generate_search_queries(const QStringList &keywords)
{
	if (keywords.isEmpty())
		return {QStringLiteral("abstract art")};

	QStringList queries;

	QStringList important;
	for (const QString &keyword : keywords) {
		if (keyword.size() > 3)
			important.push_back(keyword);
	}
	std::stable_sort(important.begin(), important.end(),
			 [](const QString &lhs, const QString &rhs) { return lhs.size() > rhs.size(); });
	queries.append(important.mid(0, 3));

	if (keywords.size() >= 2) {
		const int first_limit = std::min<int>(2, keywords.size());
		const int second_limit = std::min<int>(4, keywords.size());
		for (int i = 0; i < first_limit; ++i) {
			for (int j = i + 1; j < second_limit; ++j)
				queries.push_back(keywords.at(i) + ' ' + keywords.at(j));
		}
	}

	if (queries.isEmpty())
		queries = {QStringLiteral("nature"), QStringLiteral("landscape"), QStringLiteral("abstract")};

	return queries.mid(0, 5);
}

} // namespace sb

#include "sb-duration-splitter.hpp"

#include "sb-keywords.hpp"
#include "sb-logging.hpp"
#include "sb-time-codec.hpp"

#include <QRegularExpression>

#include <cmath>

namespace sb {
namespace {

// Each pass splits every piece produced by the previous one.
const QVector<QRegularExpression> &sentence_boundaries()
{
	static const QVector<QRegularExpression> patterns = {
		QRegularExpression(QStringLiteral("[.!?]+\\s+")),
		QRegularExpression(QStringLiteral(",\\s+(?:and|or|but|so|yet|for|nor)\\s+")),
		QRegularExpression(QStringLiteral("\\s+(?:and|or|but|so|yet|for|nor)\\s+")),
		QRegularExpression(QStringLiteral(",\\s+")),
	};
	return patterns;
}

QStringList distribute_evenly(const QStringList &units, int chunk_count)
{
	QStringList chunks;
	const int base = units.size() / chunk_count;
	const int remainder = units.size() % chunk_count;

	int start = 0;
	for (int i = 0; i < chunk_count; ++i) {
		const int size = base + (i < remainder ? 1 : 0);
		chunks.push_back(units.mid(start, size).join(' '));
		start += size;
	}
	return chunks;
}

} // namespace

DurationSplitter::DurationSplitter(double split_seconds)
	: m_split_seconds(split_seconds > 0.0 ? split_seconds : default_split_seconds())
{
}

double DurationSplitter::split_seconds() const
{
	return m_split_seconds;
}

int DurationSplitter::split_count_for_duration(double duration_seconds) const
{
	const double count = std::ceil(duration_seconds / m_split_seconds);
	if (!(count > 1.0))
		return 1;
	return static_cast<int>(count);
}

std::optional<QVector<TextSplit>> DurationSplitter::split_segment(const TextSegment &segment,
								  TimelineError *error) const
{
	if (!segment.span.is_valid()) {
		set_error(error, TimelineErrorCode::InvalidInput,
			  QString("Segment %1 ends before it starts (%2 -> %3)")
				  .arg(segment.segment_index)
				  .arg(TimeCodec::format_timestamp(segment.span.start_seconds),
				       TimeCodec::format_timestamp(segment.span.end_seconds)));
		return std::nullopt;
	}

	const int requested = split_count_for_duration(segment.span.duration());
	QStringList chunks;
	if (requested > 1)
		chunks = split_text_into_chunks(segment.text, requested);

	// Text without a single word cannot be divided; keep it whole.
	if (requested <= 1 || chunks.isEmpty())
		chunks = QStringList{segment.text};

	qCDebug(sb_timeline, "[srt-storyboard] segment %d: duration %.3fs, requested %d splits, produced %lld",
		segment.segment_index, segment.span.duration(), requested, static_cast<long long>(chunks.size()));

	const std::optional<QVector<TimeSpan>> spans = divide_span(segment.span, static_cast<int>(chunks.size()), error);
	if (!spans)
		return std::nullopt;

	QVector<TextSplit> splits;
	splits.reserve(chunks.size());
	for (int i = 0; i < chunks.size(); ++i) {
		TextSplit split;
		split.text = chunks.at(i).trimmed();
		split.span = spans->at(i);
		split.keywords = extract_keywords(chunks.at(i));
		split.segment_index = segment.segment_index;
		split.split_index = i;
		splits.push_back(split);
	}
	return splits;
}

std::optional<QVector<TimeSpan>> DurationSplitter::divide_span(const TimeSpan &span, int count, TimelineError *error)
{
	if (count <= 0) {
		set_error(error, TimelineErrorCode::InvalidSplitCount, QString("Invalid split count: %1").arg(count));
		return std::nullopt;
	}

	if (count == 1)
		return QVector<TimeSpan>{span};

	const double step = span.duration() / count;
	QVector<TimeSpan> spans;
	spans.reserve(count);

	double start = span.start_seconds;
	for (int i = 0; i < count; ++i) {
		const bool last = i == count - 1;
		const double end = last ? span.end_seconds
					: TimeCodec::round_to_millisecond(span.start_seconds + (i + 1) * step);
		spans.push_back({start, end});
		start = end;
	}
	return spans;
}

QStringList DurationSplitter::split_text_into_chunks(const QString &text, int chunk_count)
{
	if (chunk_count <= 1)
		return {text};

	const QStringList words = tokenize_words(text);
	if (words.size() <= chunk_count)
		return words;

	const QStringList sentences = split_into_sentences(text);
	if (sentences.size() >= chunk_count)
		return distribute_evenly(sentences, chunk_count);

	return distribute_evenly(words, chunk_count);
}

QStringList DurationSplitter::split_into_sentences(const QString &text)
{
	QStringList sentences{text};
	for (const QRegularExpression &pattern : sentence_boundaries()) {
		QStringList next;
		for (const QString &sentence : sentences) {
			for (const QString &part : sentence.split(pattern)) {
				const QString trimmed = part.trimmed();
				if (!trimmed.isEmpty())
					next.push_back(trimmed);
			}
		}
		sentences = next;
	}
	return sentences;
}

} // namespace sb

#include "sb-duration-splitter.hpp"
#include "sb-keywords.hpp"

#include <cstdlib>
#include <iostream>

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Splitter test failed: " << message << std::endl;
	std::exit(1);
}

sb::TextSegment make_segment(const QString &text, double start, double end, int index = 0)
{
	sb::TextSegment segment;
	segment.text = text;
	segment.span = {start, end};
	segment.segment_index = index;
	return segment;
}

void require_tiles(const QVector<sb::TextSplit> &splits, const sb::TimeSpan &span, const char *message)
{
	require(!splits.isEmpty(), message);
	require(splits.first().span.start_seconds == span.start_seconds, message);
	require(splits.last().span.end_seconds == span.end_seconds, message);
	for (int i = 0; i < splits.size(); ++i) {
		require(splits.at(i).split_index == i, message);
		require(splits.at(i).span.is_valid(), message);
		if (i > 0)
			require(splits.at(i - 1).span.end_seconds == splits.at(i).span.start_seconds, message);
	}
}

void test_split_count_for_duration()
{
	const sb::DurationSplitter splitter;
	require(splitter.split_count_for_duration(0.5) == 1, "short duration is one split");
	require(splitter.split_count_for_duration(3.0) == 1, "three seconds is one split");
	require(splitter.split_count_for_duration(3.001) == 2, "just over three seconds is two splits");
	require(splitter.split_count_for_duration(6.0) == 2, "six seconds is two splits");
	require(splitter.split_count_for_duration(9.5) == 4, "count is the ceiling");
	require(splitter.split_count_for_duration(-2.0) == 1, "non-positive duration floors at one");

	const sb::DurationSplitter two_second_splitter(2.0);
	require(two_second_splitter.split_count_for_duration(5.0) == 3, "configured split length");
	require(sb::DurationSplitter(0.0).split_seconds() == 3.0, "non-positive split length falls back");
}

void test_apple_sentence_splits_in_two()
{
	const sb::DurationSplitter splitter;
	const sb::TextSegment segment = make_segment("I like to eat an apple", 0.0, 6.0, 4);
	const std::optional<QVector<sb::TextSplit>> splits = splitter.split_segment(segment);
	require(splits.has_value(), "apple segment splits");
	require(splits->size() == 2, "apple segment has two splits");
	require_tiles(*splits, segment.span, "apple splits tile the segment");

	require(splits->at(0).text == "I like to", "first half of the words");
	require(splits->at(1).text == "eat an apple", "second half of the words");
	require(splits->at(0).span.end_seconds == 3.0, "first split ends at three seconds");
	require(splits->at(0).keywords == QStringList{"like"}, "keywords of first split");
	require((splits->at(1).keywords == QStringList{"eat", "apple"}), "keywords of second split");
	require(splits->at(1).segment_index == 4, "segment index carried to splits");
}

void test_short_segment_is_single_split()
{
	const sb::DurationSplitter splitter;
	const sb::TextSegment segment = make_segment("  Hello there, general  ", 10.0, 12.5);
	const std::optional<QVector<sb::TextSplit>> splits = splitter.split_segment(segment);
	require(splits.has_value() && splits->size() == 1, "short segment is not split");
	require(splits->first().text == "Hello there, general", "single split text is trimmed");
	require(splits->first().span.start_seconds == 10.0 && splits->first().span.end_seconds == 12.5,
		"single split keeps the full span");
	require((splits->first().keywords == QStringList{"hello", "general"}), "single split keywords");
}

void test_fewer_words_than_splits()
{
	const sb::DurationSplitter splitter;
	const sb::TextSegment segment = make_segment("Hello world", 0.0, 10.0);
	const std::optional<QVector<sb::TextSplit>> splits = splitter.split_segment(segment);
	require(splits.has_value(), "two word segment splits");
	require(splits->size() == 2, "split count follows the word count");
	require_tiles(*splits, segment.span, "word splits tile the segment");
	require(splits->at(0).span.end_seconds == 5.0, "time divided by the word-derived count");
	require(splits->at(0).text == "Hello" && splits->at(1).text == "world", "one word per split");
}

void test_sentences_distributed_to_earliest_chunks()
{
	const QStringList chunks = sb::DurationSplitter::split_text_into_chunks(
		"One two. Three four. Five six. Seven eight. Nine ten.", 3);
	require(chunks.size() == 3, "three sentence chunks");
	require(chunks.at(0) == "One two Three four", "first chunk takes an extra sentence");
	require(chunks.at(1) == "Five six Seven eight", "second chunk takes an extra sentence");
	require(chunks.at(2) == "Nine ten.", "last chunk keeps trailing punctuation");
}

void test_sentence_cascade()
{
	const QStringList sentences = sb::DurationSplitter::split_into_sentences("I came, and I saw but I left");
	require((sentences == QStringList{"I came", "I saw", "I left"}), "conjunction boundaries");

	const QStringList commas = sb::DurationSplitter::split_into_sentences("red, green, blue! Then grey");
	require((commas == QStringList{"red", "green", "blue", "Then grey"}), "punctuation then comma boundaries");
}

void test_word_fallback_distribution()
{
	const sb::DurationSplitter splitter;
	const sb::TextSegment segment = make_segment("alpha beta gamma delta epsilon zeta eta", 1.0, 8.0);
	const std::optional<QVector<sb::TextSplit>> splits = splitter.split_segment(segment);
	require(splits.has_value() && splits->size() == 3, "seven second segment has three splits");
	require_tiles(*splits, segment.span, "fallback splits tile the segment");
	require(splits->at(0).text == "alpha beta gamma", "first chunk gets the remainder word");
	require(splits->at(1).text == "delta epsilon", "second chunk");
	require(splits->at(2).text == "zeta eta", "third chunk");
	require(splits->at(0).span.end_seconds == 3.333, "boundaries are on milliseconds");
}

void test_text_without_words_stays_whole()
{
	const sb::DurationSplitter splitter;
	const sb::TextSegment segment = make_segment(QString::fromUtf8("♪ ♪"), 0.0, 9.0);
	const std::optional<QVector<sb::TextSplit>> splits = splitter.split_segment(segment);
	require(splits.has_value() && splits->size() == 1, "symbol-only text is one split");
	require(splits->first().keywords.isEmpty(), "symbol-only text has no keywords");
	require(splits->first().span.end_seconds == 9.0, "symbol-only split spans the segment");
}

void test_invalid_inputs()
{
	const sb::DurationSplitter splitter;
	sb::TimelineError error;
	require(!splitter.split_segment(make_segment("backwards", 5.0, 5.0), &error).has_value(),
		"zero-length segment rejected");
	require(error.code == sb::TimelineErrorCode::InvalidInput, "zero-length segment error code");

	require(!sb::DurationSplitter::divide_span({0.0, 3.0}, 0, &error).has_value(), "zero split count rejected");
	require(error.code == sb::TimelineErrorCode::InvalidSplitCount, "invalid split count error code");
}

void test_keyword_extraction()
{
	const QStringList keywords = sb::extract_keywords("The Apple, the APPLE and <i>banana</i>!");
	require((keywords == QStringList{"apple", "banana"}), "lower-cased, deduplicated, markup stripped");
	require(sb::extract_keywords("it is to be").isEmpty(), "stopwords and short words removed");
	require(sb::is_stopword("the") && !sb::is_stopword("apple"), "stopword lookup");
}

void test_search_queries()
{
	require((sb::generate_search_queries({}) == QStringList{"abstract art"}), "no keywords");
	require((sb::generate_search_queries({"cat"}) == QStringList{"nature", "landscape", "abstract"}),
		"fallback queries");

	const QStringList queries = sb::generate_search_queries({"apple", "eat", "banana"});
	require((queries == QStringList{"banana", "apple", "apple eat", "apple banana", "eat banana"}),
		"longest keywords first, then pairs");

	const QStringList capped = sb::generate_search_queries({"mountain", "river", "forest", "valley", "snow"});
	require(capped.size() == 5, "queries capped at five");
	require(capped.at(0) == "mountain", "longest keyword leads");
}

} // namespace

int main()
{
	test_split_count_for_duration();
	test_apple_sentence_splits_in_two();
	test_short_segment_is_single_split();
	test_fewer_words_than_splits();
	test_sentences_distributed_to_earliest_chunks();
	test_sentence_cascade();
	test_word_fallback_distribution();
	test_text_without_words_stays_whole();
	test_invalid_inputs();
	test_keyword_extraction();
	test_search_queries();
	return 0;
}

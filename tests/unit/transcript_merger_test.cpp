#include "chunkscribe/transcript_merger.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace chunkscribe;

namespace {

const std::vector<std::string> kSamples = {
    "",
    " ",
    "Hello",
    "Hello world.",
    "  leading and trailing  ",
    "Um...",
    "...",
    "a b c d e f g h i j k l",
    "tabs\tand\nnewlines",
    "ünïcödé wörds",
};

} // namespace

TEST(TranscriptMergerTest, TokenizeSplitsOnAnyWhitespace) {
    EXPECT_EQ(tokenize("  Hello,  world!\tHow\nare "), (std::vector<std::string>{"Hello,", "world!", "How", "are"}));
    EXPECT_TRUE(tokenize("   ").empty());
}

TEST(TranscriptMergerTest, MergeWithEmptyIsIdentity) {
    for (const auto& x : kSamples) {
        MergeResult into_empty = mergeTranscripts("", x);
        EXPECT_EQ(into_empty.merged, x);
        EXPECT_EQ(into_empty.new_text, x);

        if (x.empty()) continue;
        MergeResult nothing_new = mergeTranscripts(x, "");
        EXPECT_EQ(nothing_new.merged, x);
        EXPECT_EQ(nothing_new.new_text, "");
    }
}

TEST(TranscriptMergerTest, WhitespaceOnlyCurrentAddsNothing) {
    MergeResult r = mergeTranscripts("Hello", " \t ");
    EXPECT_EQ(r.merged, "Hello");
    EXPECT_EQ(r.new_text, "");
}

TEST(TranscriptMergerTest, DropsOverlappingWords) {
    MergeResult r = mergeTranscripts("Hello world", "world how are");
    EXPECT_EQ(r.merged, "Hello world how are");
    EXPECT_EQ(r.new_text, "how are");
}

TEST(TranscriptMergerTest, ConcatenatesWithoutOverlap) {
    MergeResult r = mergeTranscripts("Complete sentence.", "New sentence.");
    EXPECT_EQ(r.merged, "Complete sentence. New sentence.");
    EXPECT_EQ(r.new_text, "New sentence.");
}

TEST(TranscriptMergerTest, JoinsEllipsesOnce) {
    MergeResult r = mergeTranscripts("Um...", "...I think");
    EXPECT_EQ(r.merged, "Um... I think");
    EXPECT_EQ(r.new_text, "I think");

    MergeResult only_dots = mergeTranscripts("Um...", " ... ");
    EXPECT_EQ(only_dots.merged, "Um...");
    EXPECT_EQ(only_dots.new_text, "");
}

TEST(TranscriptMergerTest, LongestOverlapWins) {
    MergeResult r = mergeTranscripts("so x y x y", "x y x y z");
    EXPECT_EQ(r.merged, "so x y x y z");
    EXPECT_EQ(r.new_text, "z");
}

TEST(TranscriptMergerTest, FullyOverlappedChunkAddsNothing) {
    MergeResult r = mergeTranscripts("I went home", "went home");
    EXPECT_EQ(r.merged, "I went home");
    EXPECT_EQ(r.new_text, "");
}

TEST(TranscriptMergerTest, OverlapMatchIsExactIncludingPunctuation) {
    MergeResult r = mergeTranscripts("Hello world.", "world is big");
    EXPECT_EQ(r.merged, "Hello world. world is big");
    EXPECT_EQ(r.new_text, "world is big");
}

TEST(TranscriptMergerTest, OverlapSearchIsLimitedToTenTokens) {
    const std::string eleven = "a b c d e f g h i j k";
    EXPECT_EQ(findOverlap(tokenize("x " + eleven), tokenize(eleven + " y")), 0u);
    EXPECT_EQ(findOverlap(tokenize("x b c d e f g h i j k"), tokenize("b c d e f g h i j k y")), 10u);
    EXPECT_EQ(findOverlap(tokenize("a b"), tokenize("c d"), 10), 0u);
}

TEST(TranscriptMergerTest, MergeIsTotal) {
    for (const auto& previous : kSamples) {
        for (const auto& current : kSamples) {
            EXPECT_NO_THROW(mergeTranscripts(previous, current)) << "[" << previous << "] + [" << current << "]";
        }
    }
}

TEST(TranscriptMergerTest, CleanTranscriptNormalisesSpacingAroundPunctuation) {
    EXPECT_EQ(cleanTranscript("  hello   world ,  how are you ?fine  "), "hello world, how are you? fine");
    EXPECT_EQ(cleanTranscript("word .Next"), "word. Next");
    EXPECT_EQ(cleanTranscript(""), "");
    EXPECT_EQ(cleanTranscript("3.14"), "3.14");
}

TEST(TranscriptMergerTest, SpacingGuard) {
    EXPECT_EQ(ensureSpaceBefore("Hello.", "Next"), " Next");
    EXPECT_EQ(ensureSpaceBefore("word", "next"), " next");
    EXPECT_EQ(ensureSpaceBefore("word", "  next"), " next");
    EXPECT_EQ(ensureSpaceBefore("word ", "next"), "next");
    EXPECT_EQ(ensureSpaceBefore("word", ", next"), ", next");
    EXPECT_EQ(ensureSpaceBefore("(aside)", "more"), " more");
    EXPECT_EQ(ensureSpaceBefore("", "first"), "first");
}

TEST(TranscriptMergerTest, RunningTranscriptProducesTypableFragments) {
    TranscriptMerger merger;

    MergeResult first = merger.append("Hello world");
    EXPECT_EQ(first.new_text, "Hello world");
    EXPECT_EQ(merger.transcript(), "Hello world");

    MergeResult second = merger.append("world how are you ?");
    EXPECT_EQ(second.new_text, " how are you?");
    EXPECT_EQ(merger.transcript(), "Hello world how are you ?");

    MergeResult third = merger.append("");
    EXPECT_EQ(third.new_text, "");
    EXPECT_EQ(merger.fragments(), 2u);

    merger.reset();
    EXPECT_TRUE(merger.transcript().empty());
    EXPECT_EQ(merger.append("Fresh").new_text, "Fresh");
}

TEST(TranscriptMergerTest, BlankFirstChunkLeavesNoLeadingWhitespace) {
    TranscriptMerger merger;

    EXPECT_EQ(merger.append("  ").new_text, "");
    MergeResult next = merger.append("Hello");
    EXPECT_EQ(next.new_text, "Hello");
    EXPECT_EQ(merger.transcript(), "Hello");
    EXPECT_EQ(merger.append("there").new_text, " there");
    EXPECT_EQ(merger.transcript(), "Hello there");
}

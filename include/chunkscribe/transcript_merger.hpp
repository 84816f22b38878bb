#ifndef CHUNKSCRIBE_TRANSCRIPT_MERGER_HPP
#define CHUNKSCRIBE_TRANSCRIPT_MERGER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace chunkscribe {

struct MergeResult {
    std::string merged;    // Full transcript after the merge
    std::string new_text;  // Only what this chunk added
};

// Whitespace-separated tokens; punctuation stays attached
std::vector<std::string> tokenize(const std::string& text);

// Largest k <= max_overlap such that the last k tokens of previous equal the
// first k tokens of current; 0 when there is none
size_t findOverlap(const std::vector<std::string>& previous, const std::vector<std::string>& current,
                   size_t max_overlap = 10);

/**
 * Merges one chunk's transcript into the accumulated one, dropping words
 * repeated because of the audio overlap between chunks.
 *
 * Total over all inputs; never throws.
 */
MergeResult mergeTranscripts(const std::string& previous, const std::string& current);

// Collapses whitespace, removes space before .,!?;: and adds one after them before a letter
std::string cleanTranscript(const std::string& text);

// Prefixes text with a space when appending it to previous would glue two words together
std::string ensureSpaceBefore(const std::string& previous, const std::string& text);

// Running transcript for one session. Single writer.
class TranscriptMerger {
public:
    // Returns the merged transcript and the cleaned fragment to display or type
    MergeResult append(const std::string& chunk_text);

    const std::string& transcript() const { return transcript_; }
    size_t fragments() const { return fragments_; }
    void reset();

private:
    std::string transcript_;
    size_t fragments_ = 0;
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_TRANSCRIPT_MERGER_HPP

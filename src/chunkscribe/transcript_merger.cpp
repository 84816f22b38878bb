#include "chunkscribe/transcript_merger.hpp"
#include "chunkscribe/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <regex>
#include <sstream>

namespace chunkscribe {

namespace {
    const char* const kWhitespace = " \t\n\r\f\v";

    std::string ltrim(const std::string& s) {
        size_t first = s.find_first_not_of(kWhitespace);
        return first == std::string::npos ? std::string() : s.substr(first);
    }

    std::string rtrim(const std::string& s) {
        size_t last = s.find_last_not_of(kWhitespace);
        return last == std::string::npos ? std::string() : s.substr(0, last + 1);
    }

    bool isBlank(const std::string& s) {
        return s.find_first_not_of(kWhitespace) == std::string::npos;
    }

    bool isSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    bool startsWith(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    // previous + " " + text, without doubling an existing separator
    std::string joinWithSpace(const std::string& previous, const std::string& text) {
        if (previous.empty()) return text;
        if (text.empty()) return previous;
        if (isSpace(previous.back()) || isSpace(text.front())) return previous + text;
        return previous + " " + text;
    }

    std::string joinTokens(const std::vector<std::string>& tokens, size_t from) {
        std::string out;
        for (size_t i = from; i < tokens.size(); ++i) {
            if (!out.empty()) out += ' ';
            out += tokens[i];
        }
        return out;
    }

    std::string collapseWhitespace(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        bool pending_space = false;
        for (char c : text) {
            if (isSpace(c)) {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space) {
                out += ' ';
                pending_space = false;
            }
            out += c;
        }
        return out;
    }
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

size_t findOverlap(const std::vector<std::string>& previous, const std::vector<std::string>& current,
                   size_t max_overlap) {
    const size_t limit = std::min(max_overlap, std::min(previous.size(), current.size()));
    for (size_t k = limit; k > 0; --k) {
        if (std::equal(previous.end() - static_cast<std::ptrdiff_t>(k), previous.end(), current.begin())) {
            return k;
        }
    }
    return 0;
}

MergeResult mergeTranscripts(const std::string& previous, const std::string& current) {
    if (previous.empty()) {
        return {current, current};
    }
    if (isBlank(current)) {
        return {previous, ""};
    }

    // "Um..." + "...I think" -> "Um... I think"
    if (endsWith(rtrim(previous), "...") && startsWith(ltrim(current), "...")) {
        const std::string trimmed = ltrim(current);
        size_t start = trimmed.find_first_not_of(std::string(".") + kWhitespace);
        if (start == std::string::npos) {
            return {previous, ""};
        }
        const std::string rest = trimmed.substr(start);
        return {joinWithSpace(previous, rest), rest};
    }

    const std::vector<std::string> prev_tokens = tokenize(previous);
    const std::vector<std::string> curr_tokens = tokenize(current);
    const size_t overlap = findOverlap(prev_tokens, curr_tokens);

    if (overlap > 0) {
        if (overlap == curr_tokens.size()) {
            return {previous, ""};
        }
        const std::string rest = joinTokens(curr_tokens, overlap);
        return {joinWithSpace(previous, rest), rest};
    }

    return {joinWithSpace(previous, current), current};
}

std::string cleanTranscript(const std::string& text) {
    std::string out = collapseWhitespace(text);
    try {
        static const std::regex space_before_punct(R"(\s+([.,!?;:]))");
        static const std::regex punct_before_letter(R"(([.,!?;:])([A-Za-z]))");
        out = std::regex_replace(out, space_before_punct, "$1");
        out = std::regex_replace(out, punct_before_letter, "$1 $2");
    } catch (const std::regex_error& e) {
        logWarning("Merger", std::string("Transcript cleanup skipped: ") + e.what());
    }
    return out;
}

std::string ensureSpaceBefore(const std::string& previous, const std::string& text) {
    if (previous.empty() || text.empty()) return text;

    const std::string stripped = ltrim(text);
    if (stripped.empty()) return text;

    const unsigned char last = static_cast<unsigned char>(previous.back());
    const unsigned char first = static_cast<unsigned char>(stripped.front());
    const bool closing = std::strchr(".!?;:,)]}", last) != nullptr && last != '\0';

    if ((closing && std::isalpha(first)) || (std::isalnum(last) && std::isalnum(first))) {
        return " " + stripped;
    }
    return text;
}

MergeResult TranscriptMerger::append(const std::string& chunk_text) {
    // A blank first chunk must not leave leading whitespace behind
    const std::string previous = isBlank(transcript_) ? std::string() : transcript_;
    MergeResult result = mergeTranscripts(previous, chunk_text);
    transcript_ = result.merged;

    if (isBlank(result.new_text)) {
        return {transcript_, ""};
    }

    fragments_++;
    return {transcript_, ensureSpaceBefore(previous, cleanTranscript(result.new_text))};
}

void TranscriptMerger::reset() {
    transcript_.clear();
    fragments_ = 0;
}

} // namespace chunkscribe

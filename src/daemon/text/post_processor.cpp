#include "text/post_processor.hpp"

#include "logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <vector>

namespace postproc {

namespace {

constexpr size_t kMinSentenceTextLen = 20;
constexpr size_t kMinPhraseTextLen = 10;
constexpr size_t kMinPhraseWords = 4;
constexpr size_t kMinPhraseLen = 2;
constexpr size_t kMaxPhraseLen = 5;

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Splits after '.', '!' or '?' when followed by whitespace. Punctuation stays
// with its sentence.
std::vector<std::string_view> split_sentences(std::string_view text) {
    std::vector<std::string_view> out;
    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if ((c == '.' || c == '!' || c == '?') && i + 1 < text.size() && is_space(text[i + 1])) {
            out.push_back(text.substr(start, i + 1 - start));
            i++;
            while (i < text.size() && is_space(text[i])) i++;
            start = i;
            continue;
        }
        i++;
    }
    if (start < text.size()) out.push_back(text.substr(start));
    return out;
}

std::vector<std::string_view> split_words(std::string_view text) {
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) i++;
        size_t start = i;
        while (i < text.size() && !is_space(text[i])) i++;
        if (i > start) out.push_back(text.substr(start, i - start));
    }
    return out;
}

std::string join(const std::vector<std::string_view>& parts, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end; i++) {
        if (!out.empty()) out += ' ';
        out += parts[i];
    }
    return out;
}

std::string phrase_at(const std::vector<std::string_view>& words, size_t end, size_t len) {
    return lower(join(words, end - len, end));
}

template <typename Pass>
std::string until_stable(std::string_view text, Pass pass) {
    std::string current(text);
    while (true) {
        auto next = pass(current);
        if (next == current) return current;
        current = std::move(next);
    }
}

std::string collapse_sentences_once(std::string_view text) {
    if (text.size() < kMinSentenceTextLen) return std::string(text);

    auto sentences = split_sentences(trim(text));
    if (sentences.size() < 2) return std::string(text);

    auto last = lower(trim(sentences.back()));
    size_t repeats = 0;
    for (size_t i = sentences.size(); i-- > 0;) {
        if (lower(trim(sentences[i])) != last) break;
        repeats++;
    }

    if (repeats < 2) return std::string(text);

    logging::debug("postproc: removed {} repeated sentences: \"{}\"", repeats - 1, last);
    return join(sentences, 0, sentences.size() - repeats + 1);
}

std::string collapse_phrases_once(std::string_view text) {
    if (text.size() < kMinPhraseTextLen) return std::string(text);

    auto words = split_words(text);
    if (words.size() < kMinPhraseWords) return std::string(text);

    size_t max_len = std::min(kMaxPhraseLen, words.size() / 2);
    for (size_t len = kMinPhraseLen; len <= max_len; len++) {
        auto last = phrase_at(words, words.size(), len);
        size_t repeats = 0;
        for (size_t end = words.size(); end >= len; end -= len) {
            if (phrase_at(words, end, len) != last) break;
            repeats++;
        }

        if (repeats >= 2) {
            logging::debug("postproc: removed {} trailing phrase repetitions: \"{}\"",
                           repeats - 1, last);
            return join(words, 0, words.size() - (repeats - 1) * len);
        }
    }
    return std::string(text);
}

constexpr std::array<std::string_view, 11> kFullTextHallucinations = {
    "thank you.",
    "thanks for watching.",
    "bye.",
    "you",
    "thank you for watching.",
    "thanks for watching!",
    "the end.",
    "subscribe.",
    "...",
    ". . .",
    "you.",
};

const std::vector<std::regex>& trailing_patterns() {
    static const std::vector<std::regex> patterns = [] {
        constexpr auto flags = std::regex::ECMAScript | std::regex::icase;
        return std::vector<std::regex>{
            std::regex(R"(\s*\bThank you\.?\s*$)", flags),
            std::regex(R"(\s*\bThanks for watching\.?\s*$)", flags),
            std::regex(R"(\s*\bBye\.?\s*$)", flags),
            std::regex(R"(\s*\bThe end\.?\s*$)", flags),
            std::regex(R"(\s*\bSubscribe\.?\s*$)", flags),
            std::regex(R"(\s*\.{3,}\s*$)", flags),
        };
    }();
    return patterns;
}

bool is_full_text_hallucination(std::string_view trimmed) {
    auto l = lower(trimmed);
    return std::ranges::find(kFullTextHallucinations, l) != kFullTextHallucinations.end();
}

std::string strip_once(std::string_view text) {
    auto trimmed = trim(text);
    if (trimmed.empty()) return std::string(text);

    if (is_full_text_hallucination(trimmed)) {
        logging::debug("postproc: filtered full-text hallucination: \"{}\"", trimmed);
        return {};
    }

    std::string cleaned(trimmed);
    for (const auto& pattern : trailing_patterns()) {
        cleaned = std::regex_replace(cleaned, pattern, "");
    }

    if (cleaned == trimmed) return std::string(text);

    logging::debug("postproc: stripped trailing hallucination: \"{}\" -> \"{}\"", trimmed, cleaned);
    return std::string(trim(cleaned));
}

} // namespace

std::string collapse_repeated_sentences(std::string_view text) {
    return until_stable(text, collapse_sentences_once);
}

std::string collapse_trailing_phrases(std::string_view text) {
    return until_stable(text, collapse_phrases_once);
}

std::string strip_hallucinations(std::string_view text) {
    return until_stable(text, strip_once);
}

std::string clean(std::string_view text) {
    return until_stable(text, [](std::string_view t) {
        return strip_hallucinations(collapse_trailing_phrases(collapse_repeated_sentences(t)));
    });
}

} // namespace postproc

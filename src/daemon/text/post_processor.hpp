#pragma once

#include <string>
#include <string_view>

// Removes decoder hallucinations and repetition artifacts from transcripts.
// Every function is pure and idempotent, and returns its input unchanged when
// the pattern it targets is absent.
namespace postproc {

// "Thank you. Thank you. Thank you." -> "Thank you."
// Collapses a final sentence that repeats two or more times in a row at the
// end of the text (case-insensitive).
std::string collapse_repeated_sentences(std::string_view text);

// "the quick fox the quick fox" -> "the quick fox"
// Checks phrase lengths 2..5 words, shortest first, and collapses the first
// one that repeats at the end of the word sequence.
std::string collapse_trailing_phrases(std::string_view text);

// Whole-text hallucinations ("Thank you.", "you") become empty; known
// boilerplate endings are stripped from otherwise real text.
std::string strip_hallucinations(std::string_view text);

// The three passes above, in order, repeated until the text stops changing.
std::string clean(std::string_view text);

} // namespace postproc

#pragma once
#include <string>
#include <vector>

namespace textutil {

std::string trim(const std::string& s);

std::string to_lower_ascii(std::string s);

// trim + every run of spaces/tabs/\r becomes one space
std::string collapse_whitespace(const std::string& s);

// lowercase, keep letters/digits, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// word-boundary phrase test on two normalize()d strings
bool contains_phrase(const std::string& normalized_haystack, const std::string& normalized_phrase);

size_t count_words(const std::string& s);

std::vector<std::string> split_words(const std::string& s);

// at least two letters, none lowercase
bool is_all_caps(const std::string& s);

// first letter uppercase and every word longer than three letters capitalized
bool is_title_case(const std::string& s);

bool is_all_digits(const std::string& s);

// Splits running text on . ! ? followed by whitespace and an uppercase letter,
// digit, quote or bracket. Common abbreviations (e.g., Fig.) and name initials
// do not end a sentence. "et al." ends one only before a capitalized word.
std::vector<std::string> split_sentences(const std::string& text);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

}  // namespace textutil

#pragma once
#include <string>
#include <vector>

namespace canon::textutil {

// ASCII-only lowercase; bytes >= 0x80 pass through untouched
std::string to_lower_ascii(std::string s);

std::string trim(const std::string& s);

// turn runs of whitespace into one space and trim both ends
std::string collapse_spaces(const std::string& s);

// [a-z0-9] after lowercasing; everything else is a word boundary
bool is_word_char(char c);

// position of the first whole-word occurrence of phrase at or after from, or npos
size_t find_phrase(const std::string& s, const std::string& phrase, size_t from = 0);

// replace every whole-word occurrence of each phrase (in list order) with a space
std::string remove_phrases(std::string s, const std::vector<std::string>& phrases);

// split on single spaces, dropping empties
std::vector<std::string> split_words(const std::string& s);

std::string join_words(const std::vector<std::string>& words);

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

}  // namespace canon::textutil

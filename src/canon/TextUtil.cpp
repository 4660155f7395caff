#include "canon/TextUtil.hpp"
#include <cctype>

namespace canon::textutil {

std::string to_lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace((unsigned char)s[i])) ++i;
    while (j > i && std::isspace((unsigned char)s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::string collapse_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char c : s) {
        if (std::isspace(c)) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        } else {
            out.push_back((char)c);
            prev_space = false;
        }
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

bool is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

size_t find_phrase(const std::string& s, const std::string& phrase, size_t from) {
    if (phrase.empty()) return std::string::npos;

    size_t pos = s.find(phrase, from);
    while (pos != std::string::npos) {
        const size_t end = pos + phrase.size();
        const bool left_ok = (pos == 0) || !is_word_char(s[pos - 1]);
        const bool right_ok = (end == s.size()) || !is_word_char(s[end]);
        if (left_ok && right_ok) return pos;
        pos = s.find(phrase, pos + 1);
    }
    return std::string::npos;
}

std::string remove_phrases(std::string s, const std::vector<std::string>& phrases) {
    for (const auto& p : phrases) {
        size_t pos = find_phrase(s, p);
        while (pos != std::string::npos) {
            s.replace(pos, p.size(), " ");
            pos = find_phrase(s, p, pos + 1);
        }
    }
    return s;
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string cur;

    for (char c : s) {
        if (c == ' ') {
            if (!cur.empty()) {
                words.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) words.push_back(cur);
    return words;
}

std::string join_words(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out.push_back(' ');
        out += w;
    }
    return out;
}

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& n : needles) {
        if (!n.empty() && haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace canon::textutil

#pragma once

#include <string>

namespace ledger::utils {

/**
 * @brief Убрать пробельные символы по краям (ASCII и U+3000)
 */
inline std::string trim(const std::string& str) {
    static const std::string IDEOGRAPHIC_SPACE = "\xE3\x80\x80";
    auto isAsciiSpace = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };

    size_t begin = 0;
    size_t end = str.size();
    while (begin < end) {
        if (isAsciiSpace(str[begin])) {
            ++begin;
        } else if (str.compare(begin, IDEOGRAPHIC_SPACE.size(), IDEOGRAPHIC_SPACE) == 0) {
            begin += IDEOGRAPHIC_SPACE.size();
        } else {
            break;
        }
    }
    while (end > begin) {
        if (isAsciiSpace(str[end - 1])) {
            --end;
        } else if (end - begin >= IDEOGRAPHIC_SPACE.size() &&
                   str.compare(end - IDEOGRAPHIC_SPACE.size(), IDEOGRAPHIC_SPACE.size(), IDEOGRAPHIC_SPACE) == 0) {
            end -= IDEOGRAPHIC_SPACE.size();
        } else {
            break;
        }
    }
    return str.substr(begin, end - begin);
}

inline bool startsWith(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace ledger::utils

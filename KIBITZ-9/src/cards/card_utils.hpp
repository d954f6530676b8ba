#pragma once

#include <cctype>
#include <cstdint>
#include <string>

namespace CardUtils {

    // how many letters we can check (ASCII)
    constexpr int MAX_CHAR_LIMIT = 128;

    // UTF-8 encodings of the suit glyphs the table font uses (filled and outlined)
    constexpr const char* SPADE_GLYPHS[]   = { "\xE2\x99\xA0", "\xE2\x99\xA4" };
    constexpr const char* HEART_GLYPHS[]   = { "\xE2\x99\xA5", "\xE2\x99\xA1" };
    constexpr const char* DIAMOND_GLYPHS[] = { "\xE2\x99\xA6", "\xE2\x99\xA2" };
    constexpr const char* CLUB_GLYPHS[]    = { "\xE2\x99\xA3", "\xE2\x99\xA7" };

    // if rank is lowercase, uppercase it
    inline char normalizeRank(char r) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(r)));
    }

    // if suit is uppercase, lowercase it
    inline char normalizeSuit(char s) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(s)));
    }

    // single character rank into its point value 2..14 (or 0 if garbage)
    // '10' has two characters and is handled by getRankValue(std::string)
    inline int getRankValue(char r) {
        switch (normalizeRank(r)) {
            case '2': return 2;
            case '3': return 3;
            case '4': return 4;
            case '5': return 5;
            case '6': return 6;
            case '7': return 7;
            case '8': return 8;
            case '9': return 9;
            case 'T': return 10;
            case 'J': return 11;
            case 'Q': return 12;
            case 'K': return 13;
            case 'A': return 14;
            default: return 0;
        }
    }

    inline int getRankValue(const std::string& token) {
        if (token.size() == 1) return getRankValue(token[0]);
        if (token == "10") return 10;
        return 0;
    }

    // letter suit into 0..3 (clubs, diamonds, hearts, spades), -1 if garbage
    inline int getSuitIndex(char s) {
        auto uc = static_cast<unsigned char>(s);
        if (uc >= MAX_CHAR_LIMIT) return -1;
        switch (normalizeSuit(s)) {
            case 'c': return 0;
            case 'd': return 1;
            case 'h': return 2;
            case 's': return 3;
            default: return -1;
        }
    }
}

/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/LogicUtils.h
 *
 * Description:
 * Pure text utilities used by the grammar matchers.
 * Kept header-only and free of std::regex so the matchers behave the same
 * in the replay tool and in the native tests.
 * =================================================================================
 */
#pragma once
#include <stdio.h>
#include <string.h>
#include <stdint.h>
#include <ctype.h>

class LogicUtils {
public:
    static bool startsWith(const char *text, const char *prefix) {
        return strncmp(text, prefix, strlen(prefix)) == 0;
    }

    static bool contains(const char *text, const char *needle) {
        return strstr(text, needle) != nullptr;
    }

    /**
     * Parses a decimal number without a leading zero in [minVal, maxVal].
     * On success *end points just past the last digit.
     * @return true if a valid number was read.
     */
    static bool parseBoundedNumber(const char *text, int32_t minVal, int32_t maxVal,
                                   int32_t &outValue, const char **end) {
        if (!isdigit((unsigned char)text[0]) || text[0] == '0') return false;

        int32_t value = 0;
        const char *p = text;
        while (isdigit((unsigned char)*p)) {
            value = value * 10 + (*p - '0');
            if (value > maxVal) return false;
            p++;
        }
        if (value < minVal) return false;

        outValue = value;
        *end = p;
        return true;
    }

    /**
     * Reads one or more digits (leading zeros allowed).
     * @return pointer past the digits, or nullptr if none were found.
     */
    static const char *skipDigits(const char *text, int32_t &outValue) {
        const char *p = text;
        int32_t value = 0;
        while (isdigit((unsigned char)*p)) {
            if (value < 100000000) value = value * 10 + (*p - '0');
            p++;
        }
        if (p == text) return nullptr;
        outValue = value;
        return p;
    }

    /**
     * Removes markup tags ("<col=ff3045>Wave: 1</col>" -> "Wave: 1").
     * Output is always NUL-terminated and truncated to size - 1.
     */
    static void stripTags(const char *input, char *output, size_t size) {
        if (size == 0) return;

        size_t o = 0;
        for (const char *p = input; *p != '\0' && o < size - 1; p++) {
            if (*p == '<') {
                // An unterminated '<' is plain text
                const char *close = strchr(p, '>');
                if (close != nullptr) {
                    p = close;
                    continue;
                }
            }
            output[o++] = *p;
        }
        output[o] = '\0';
    }
};

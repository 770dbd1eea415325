#ifndef THUMB_UTILS_HPP
#define THUMB_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace thumb::utils {

inline bool isSpace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

inline std::string_view skipSpaces(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && isSpace(s[start])) ++start;
    return s.substr(start);
}

inline std::string_view trim(std::string_view s) {
    s = skipSpaces(s);
    std::size_t end = s.size();
    while (end > 0 && isSpace(s[end - 1])) --end;
    return s.substr(0, end);
}

inline bool isBlank(std::string_view s) { return skipSpaces(s).empty(); }

// Splits off the first whitespace-delimited token. Leading whitespace is skipped; the rest
// starts right after the token (its leading whitespace is kept).
inline std::pair<std::string_view, std::string_view> splitToken(std::string_view s) {
    s = skipSpaces(s);
    std::size_t end = 0;
    while (end < s.size() && !isSpace(s[end])) ++end;
    return {s.substr(0, end), s.substr(end)};
}

inline std::vector<std::string_view> splitWords(std::string_view s) {
    std::vector<std::string_view> out;
    for (;;) {
        auto [token, rest] = splitToken(s);
        if (token.empty()) break;
        out.push_back(token);
        s = rest;
    }
    return out;
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    for (auto& ch : out) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

// Aliases and argument names: non-empty, ASCII lowercase letters and digits only.
inline bool isValidName(std::string_view s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](char ch) { return (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9'); });
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

inline std::string joinAliases(const std::vector<std::string>& aliases) { return join(aliases, "|"); }

// Returns the code point if `s` holds exactly one well-formed UTF-8 sequence.
inline std::optional<char32_t> decodeSingleCodePoint(std::string_view s) {
    if (s.empty()) return std::nullopt;
    const auto lead = static_cast<unsigned char>(s[0]);
    std::size_t len = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
        len = 1;
        cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
    } else {
        return std::nullopt;
    }
    if (s.size() != len) return std::nullopt;
    for (std::size_t i = 1; i < len; ++i) {
        const auto cont = static_cast<unsigned char>(s[i]);
        if ((cont & 0xC0) != 0x80) return std::nullopt;
        cp = (cp << 6) | (cont & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range values are not characters.
    static constexpr char32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return std::nullopt;
    return cp;
}

inline std::string encodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

inline std::size_t levenshteinDistance(std::string_view a, std::string_view b) {
    const std::size_t n = a.size();
    const std::size_t m = b.size();
    if (n == 0) return m;
    if (m == 0) return n;

    std::vector<std::size_t> prev(m + 1), cur(m + 1);
    for (std::size_t j = 0; j <= m; ++j) prev[j] = j;

    for (std::size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= m; ++j) {
            const std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        prev.swap(cur);
    }
    return prev[m];
}

// Candidates starting with `input` rank first, then by edit distance, then alphabetically.
inline std::vector<std::string> suggest(std::string_view input,
                                        const std::vector<std::string>& candidates,
                                        std::size_t maxDistance = 2,
                                        std::size_t maxResults = 3) {
    struct Scored {
        std::string value;
        std::size_t score;
    };

    std::vector<Scored> scored;
    scored.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (c.empty()) continue;
        if (!input.empty() && c.rfind(input, 0) == 0) {
            scored.push_back({c, 0});
            continue;
        }
        scored.push_back({c, levenshteinDistance(input, c)});
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score < b.score;
        return a.value < b.value;
    });

    std::vector<std::string> out;
    out.reserve(maxResults);
    for (const auto& s : scored) {
        if (out.size() >= maxResults) break;
        if (s.score <= maxDistance) out.push_back(s.value);
    }
    return out;
}

} // namespace thumb::utils

#endif // THUMB_UTILS_HPP

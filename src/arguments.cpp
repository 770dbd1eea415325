#include "thumb/arguments.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string_view>
#include <type_traits>
#include <utility>

#include "thumb/utils.hpp"

namespace {

constexpr const char* kNumericExpected = "Numeric value expected";

template <typename T>
static bool tryParseSignedInt(std::string_view s, T& out) {
    static_assert(std::numeric_limits<T>::is_integer && std::numeric_limits<T>::is_signed, "signed integer required");
    const auto t = thumb::utils::trim(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v < static_cast<long long>(std::numeric_limits<T>::min()) || v > static_cast<long long>(std::numeric_limits<T>::max())) {
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

template <typename T>
static bool tryParseFloat(std::string_view s, T& out) {
    static_assert(std::is_floating_point_v<T>, "floating point required");
    const auto t = thumb::utils::trim(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    T v{};
    if constexpr (std::is_same_v<T, float>) {
        v = std::strtof(tmp.c_str(), &end);
    } else if constexpr (std::is_same_v<T, double>) {
        v = std::strtod(tmp.c_str(), &end);
    } else {
        v = std::strtold(tmp.c_str(), &end);
    }
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

template <typename T>
static thumb::ArgumentType<T> numericType(bool (*parse)(std::string_view, T&)) {
    thumb::ArgumentType<T> type;
    type.convert = [parse](std::string_view token, T& out) -> std::optional<std::string> {
        if (parse(token, out)) return std::nullopt;
        return std::string(kNumericExpected);
    };
    return type;
}

static bool readNumber(std::string_view s, std::size_t& pos, std::size_t minDigits, std::size_t maxDigits, int& out) {
    const std::size_t start = pos;
    int v = 0;
    while (pos < s.size() && pos - start < maxDigits && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        v = v * 10 + (s[pos] - '0');
        ++pos;
    }
    if (pos - start < minDigits) return false;
    out = v;
    return true;
}

static bool expectChar(std::string_view s, std::size_t& pos, char ch) {
    if (pos >= s.size() || s[pos] != ch) return false;
    ++pos;
    return true;
}

static int daysInMonth(int year, int month) {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0)) return 29;
    return kDays[month - 1];
}

// YYYY-MM-DD or DD.MM.YYYY
static bool parseDate(std::string_view s, std::size_t& pos, thumb::DateTime& out) {
    const std::size_t start = pos;
    if (readNumber(s, pos, 4, 4, out.year) && expectChar(s, pos, '-')) {
        if (!readNumber(s, pos, 1, 2, out.month) || !expectChar(s, pos, '-') || !readNumber(s, pos, 1, 2, out.day)) {
            return false;
        }
    } else {
        pos = start;
        if (!readNumber(s, pos, 1, 2, out.day) || !expectChar(s, pos, '.') || !readNumber(s, pos, 1, 2, out.month) ||
            !expectChar(s, pos, '.') || !readNumber(s, pos, 4, 4, out.year)) {
            return false;
        }
    }
    if (out.year < 1 || out.month < 1 || out.month > 12) return false;
    if (out.day < 1 || out.day > daysInMonth(out.year, out.month)) return false;
    out.hasDate = true;
    return true;
}

// HH:MM or HH:MM:SS
static bool parseTime(std::string_view s, std::size_t& pos, thumb::DateTime& out) {
    if (!readNumber(s, pos, 1, 2, out.hour) || !expectChar(s, pos, ':') || !readNumber(s, pos, 2, 2, out.minute)) {
        return false;
    }
    if (pos < s.size() && s[pos] == ':') {
        ++pos;
        if (!readNumber(s, pos, 2, 2, out.second)) return false;
    }
    if (out.hour > 23 || out.minute > 59 || out.second > 59) return false;
    out.hasTime = true;
    return true;
}

static bool tryParseDateTime(std::string_view s, thumb::DateTime& out) {
    const auto t = thumb::utils::trim(s);
    if (t.empty()) return false;

    thumb::DateTime dt;
    std::size_t pos = 0;
    if (parseDate(t, pos, dt)) {
        if (pos == t.size()) {
            out = dt;
            return true;
        }
        if (t[pos] == 'T') {
            ++pos;
        } else if (thumb::utils::isSpace(t[pos])) {
            while (pos < t.size() && thumb::utils::isSpace(t[pos])) ++pos;
        } else {
            return false;
        }
        if (!parseTime(t, pos, dt) || pos != t.size()) return false;
        out = dt;
        return true;
    }

    dt = thumb::DateTime{};
    pos = 0;
    if (!parseTime(t, pos, dt) || pos != t.size()) return false;
    out = dt;
    return true;
}

struct SynonymTable {
    const char* trueWords[2];
    const char* falseWords[2];
};

static const SynonymTable& synonymTable(thumb::BoolSynonyms synonyms) {
    static const SynonymTable trueFalse{{"true", "t"}, {"false", "f"}};
    static const SynonymTable yesNo{{"yes", "y"}, {"no", "n"}};
    static const SynonymTable allowedForbidden{{"allowed", "a"}, {"forbidden", "f"}};
    switch (synonyms) {
        case thumb::BoolSynonyms::TrueFalse: return trueFalse;
        case thumb::BoolSynonyms::YesNo: return yesNo;
        case thumb::BoolSynonyms::AllowedForbidden: return allowedForbidden;
    }
    return trueFalse;
}

template <typename T>
static thumb::Argument declare(thumb::ArgumentType<T> type, int position, std::string name, std::string description) {
    return thumb::Argument::make(thumb::ArgumentSpec{position, std::move(name), std::move(description)}, std::move(type));
}

} // namespace

namespace thumb {

std::string DateTime::toString() const {
    char buf[32];
    if (hasDate && hasTime) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", year, month, day, hour, minute, second);
    } else if (hasDate) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    } else {
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", hour, minute, second);
    }
    return buf;
}

namespace args {

ArgumentType<int> integerType() { return numericType<int>(&tryParseSignedInt<int>); }

ArgumentType<std::int64_t> longIntegerType() { return numericType<std::int64_t>(&tryParseSignedInt<std::int64_t>); }

ArgumentType<float> floatType() { return numericType<float>(&tryParseFloat<float>); }

ArgumentType<double> doubleType() { return numericType<double>(&tryParseFloat<double>); }

ArgumentType<long double> decimalType() { return numericType<long double>(&tryParseFloat<long double>); }

ArgumentType<int> nonNegativeIntegerType() {
    return withValidation(integerType(), [](const int& value) -> std::optional<std::string> {
        if (value < 0) return std::string("Non-negative value expected");
        return std::nullopt;
    });
}

ArgumentType<std::vector<int>> integerArrayType() {
    ArgumentType<std::vector<int>> type;
    type.multisegmentedOnly = true;
    type.convert = [](std::string_view token, std::vector<int>& out) -> std::optional<std::string> {
        const auto words = utils::splitWords(token);
        out.clear();
        out.reserve(words.size());
        for (std::size_t i = 0; i < words.size(); ++i) {
            int v = 0;
            if (!tryParseSignedInt<int>(words[i], v)) {
                return "Element #" + std::to_string(i + 1) + ": numeric value expected";
            }
            out.push_back(v);
        }
        return std::nullopt;
    };
    return type;
}

ArgumentType<std::string> stringType() {
    ArgumentType<std::string> type;
    type.convert = [](std::string_view token, std::string& out) -> std::optional<std::string> {
        out.assign(token);
        return std::nullopt;
    };
    return type;
}

ArgumentType<char32_t> characterType() {
    ArgumentType<char32_t> type;
    type.convert = [](std::string_view token, char32_t& out) -> std::optional<std::string> {
        const auto cp = utils::decodeSingleCodePoint(token);
        if (!cp) return std::string("Single character expected");
        out = *cp;
        return std::nullopt;
    };
    return type;
}

ArgumentType<DateTime> dateTimeType() {
    ArgumentType<DateTime> type;
    type.convert = [](std::string_view token, DateTime& out) -> std::optional<std::string> {
        if (tryParseDateTime(token, out)) return std::nullopt;
        return std::string("Date/time value expected");
    };
    return type;
}

ArgumentType<bool> booleanType(BoolSynonyms synonyms) {
    ArgumentType<bool> type;
    type.convert = [synonyms](std::string_view token, bool& out) -> std::optional<std::string> {
        const auto& table = synonymTable(synonyms);
        const auto word = utils::toLower(token);
        for (const char* w : table.trueWords) {
            if (word == w) {
                out = true;
                return std::nullopt;
            }
        }
        for (const char* w : table.falseWords) {
            if (word == w) {
                out = false;
                return std::nullopt;
            }
        }
        return std::string("Permissible values are: ") + table.trueWords[0] + ", " + table.trueWords[1] + "; or: " +
               table.falseWords[0] + ", " + table.falseWords[1];
    };
    return type;
}

Argument integer(int position, std::string name, std::string description) {
    return declare(integerType(), position, std::move(name), std::move(description));
}

Argument longInteger(int position, std::string name, std::string description) {
    return declare(longIntegerType(), position, std::move(name), std::move(description));
}

Argument floating(int position, std::string name, std::string description) {
    return declare(floatType(), position, std::move(name), std::move(description));
}

Argument doublePrecision(int position, std::string name, std::string description) {
    return declare(doubleType(), position, std::move(name), std::move(description));
}

Argument decimal(int position, std::string name, std::string description) {
    return declare(decimalType(), position, std::move(name), std::move(description));
}

Argument nonNegativeInteger(int position, std::string name, std::string description) {
    return declare(nonNegativeIntegerType(), position, std::move(name), std::move(description));
}

Argument integerArray(int position, std::string name, std::string description) {
    auto a = declare(integerArrayType(), position, std::move(name), std::move(description));
    a.multisegmented();
    return a;
}

Argument string(int position, std::string name, std::string description) {
    return declare(stringType(), position, std::move(name), std::move(description));
}

Argument character(int position, std::string name, std::string description) {
    return declare(characterType(), position, std::move(name), std::move(description));
}

Argument dateTime(int position, std::string name, std::string description) {
    return declare(dateTimeType(), position, std::move(name), std::move(description));
}

Argument boolean(int position, std::string name, std::string description, BoolSynonyms synonyms) {
    return declare(booleanType(synonyms), position, std::move(name), std::move(description));
}

} // namespace args
} // namespace thumb

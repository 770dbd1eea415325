#ifndef THUMB_ARGUMENTS_HPP
#define THUMB_ARGUMENTS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "argument.hpp"

namespace thumb {

struct DateTime {
    int year{0};
    int month{0};
    int day{0};
    int hour{0};
    int minute{0};
    int second{0};
    bool hasDate{false};
    bool hasTime{false};

    // "YYYY-MM-DD", "HH:MM:SS" or "YYYY-MM-DD HH:MM:SS" depending on what was given.
    [[nodiscard]] std::string toString() const;
};

inline bool operator==(const DateTime& a, const DateTime& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day && a.hour == b.hour && a.minute == b.minute &&
           a.second == b.second && a.hasDate == b.hasDate && a.hasTime == b.hasTime;
}

// Boolean families differ only by the words they accept.
enum class BoolSynonyms {
    TrueFalse,        // true/t, false/f
    YesNo,            // yes/y, no/n
    AllowedForbidden, // allowed/a, forbidden/f
};

namespace args {

ArgumentType<int> integerType();
ArgumentType<std::int64_t> longIntegerType();
ArgumentType<float> floatType();
ArgumentType<double> doubleType();
ArgumentType<long double> decimalType();
ArgumentType<int> nonNegativeIntegerType();
ArgumentType<std::vector<int>> integerArrayType();
ArgumentType<std::string> stringType();
ArgumentType<char32_t> characterType();
ArgumentType<DateTime> dateTimeType();
ArgumentType<bool> booleanType(BoolSynonyms synonyms);

Argument integer(int position, std::string name, std::string description);
Argument longInteger(int position, std::string name, std::string description);
Argument floating(int position, std::string name, std::string description);
Argument doublePrecision(int position, std::string name, std::string description);
Argument decimal(int position, std::string name, std::string description);
Argument nonNegativeInteger(int position, std::string name, std::string description);
// Always declared multisegmented.
Argument integerArray(int position, std::string name, std::string description);
Argument string(int position, std::string name, std::string description);
Argument character(int position, std::string name, std::string description);
Argument dateTime(int position, std::string name, std::string description);
Argument boolean(int position, std::string name, std::string description, BoolSynonyms synonyms = BoolSynonyms::TrueFalse);

} // namespace args
} // namespace thumb

#endif // THUMB_ARGUMENTS_HPP

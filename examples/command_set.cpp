#include "command_set.hpp"

#include <ctime>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

enum class DisplayFormat { DateOnly, TimeOnly, Full };

// Custom argument type: the user-facing words map onto an enum.
thumb::ArgumentType<DisplayFormat> displayFormatType() {
    thumb::ArgumentType<DisplayFormat> type;
    type.convert = [](std::string_view token, DisplayFormat& out) -> std::optional<std::string> {
        const auto word = thumb::utils::toLower(token);
        if (word == "d" || word == "date") {
            out = DisplayFormat::DateOnly;
        } else if (word == "t" || word == "time") {
            out = DisplayFormat::TimeOnly;
        } else if (word == "f" || word == "full") {
            out = DisplayFormat::Full;
        } else {
            return std::string("Only date/time/full or d/t/f values are expected");
        }
        return std::nullopt;
    };
    return type;
}

std::size_t countCodePoints(const std::string& s) {
    std::size_t n = 0;
    for (const char ch : s) {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string repeat(const std::string& s, int times) {
    std::string out;
    for (int i = 0; i < times; ++i) out += s + ' ';
    return out;
}

thumb::Command displaySampleText() {
    thumb::Command cmd({"displaysampletext", "dst"}, "display sample text");
    cmd.action([](const thumb::Args&) {
        return std::string("Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod tempor incididunt ut ...");
    });
    return cmd;
}

thumb::Command countCharacters() {
    thumb::Command cmd({"countchars", "cc"}, "count characters in a word");
    cmd.argument(thumb::args::string(0, "word", "word to count characters in"));
    cmd.action([](const thumb::Args& a) { return std::to_string(countCodePoints(a.get<std::string>("word"))); });
    return cmd;
}

thumb::Command countWords() {
    thumb::Command cmd({"countwords", "cw"}, "count words");
    cmd.argument(thumb::args::string(0, "text", "text to count words in").multisegmented());
    cmd.action([](const thumb::Args& a) {
        return std::to_string(thumb::utils::splitWords(a.get<std::string>("text")).size());
    });
    return cmd;
}

thumb::Command removeCharacter() {
    thumb::Command cmd({"removechar", "rc"}, "remove character in a word");
    cmd.argument(thumb::args::string(0, "word", "word to remove character from"));
    cmd.argument(thumb::args::character(1, "char", "character to be removed").optional());
    cmd.action([](const thumb::Args& a) {
        auto word = a.get<std::string>("word");
        if (a.omitted("char")) return word;
        const auto needle = thumb::utils::encodeUtf8(a.get<char32_t>("char"));
        for (auto pos = word.find(needle); pos != std::string::npos; pos = word.find(needle, pos)) {
            word.erase(pos, needle.size());
        }
        return word;
    });
    return cmd;
}

// The default "one" is not a number: omitting "times" reports a parse error.
thumb::Command repeatWord() {
    thumb::Command cmd({"repw"}, "repeat word X number of times");
    cmd.argument(thumb::args::string(0, "word", "word to repeat"));
    cmd.argument(thumb::args::nonNegativeInteger(1, "times", "number of times to repeat").defaultValue("one"));
    cmd.action([](const thumb::Args& a) { return repeat(a.get<std::string>("word"), a.get<int>("times")); });
    return cmd;
}

thumb::Command repeatPhrase() {
    thumb::Command cmd({"repp"}, "repeat phrase X number of times");
    cmd.argument(thumb::args::nonNegativeInteger(0, "times", "number of times to repeat"));
    cmd.argument(thumb::args::string(1, "phrase", "phrase to repeat").multisegmented());
    cmd.action([](const thumb::Args& a) { return repeat(a.get<std::string>("phrase"), a.get<int>("times")); });
    return cmd;
}

thumb::Command divide() {
    auto divisor = thumb::withValidation(thumb::args::integerType(), [](const int& v) -> std::optional<std::string> {
        if (v == 0) return std::string("Divisor can not be zero");
        return std::nullopt;
    });

    thumb::Command cmd({"divide", "div"}, "divide two integer values");
    cmd.argument(thumb::args::integer(0, "dvd", "dividend"));
    cmd.argument(thumb::Argument::make(thumb::ArgumentSpec{1, "dvs", "divisor"}, std::move(divisor)));
    cmd.action([](const thumb::Args& a) {
        std::ostringstream oss;
        oss << static_cast<float>(a.get<int>("dvd")) / static_cast<float>(a.get<int>("dvs"));
        return oss.str();
    });
    return cmd;
}

thumb::Command addValues() {
    thumb::Command cmd({"add"}, "add arbitrary number of values");
    cmd.argument(thumb::args::integerArray(0, "values", "array of values, split by spaces").defaultValue(""));
    cmd.action([](const thumb::Args& a) {
        long long sum = 0;
        for (const int v : a.get<std::vector<int>>("values")) {
            sum += v;
            if (sum > std::numeric_limits<int>::max() || sum < std::numeric_limits<int>::min()) {
                return std::string("Can not compute, sum is too big.");
            }
        }
        return std::to_string(sum);
    });
    return cmd;
}

thumb::Command showDateTime() {
    thumb::Command cmd({"showdatetime", "sdt"}, "show current date and time");
    cmd.argument(thumb::Argument::make(thumb::ArgumentSpec{0, "format", "date time format: date/time/full or d/t/f"},
                                       displayFormatType())
                     .defaultValue("full"));
    cmd.action([](const thumb::Args& a) {
        const char* pattern = "%Y-%m-%d %H:%M:%S";
        switch (a.get<DisplayFormat>("format")) {
            case DisplayFormat::DateOnly: pattern = "%Y-%m-%d"; break;
            case DisplayFormat::TimeOnly: pattern = "%H:%M"; break;
            case DisplayFormat::Full: break;
        }
        const std::time_t now = std::time(nullptr);
        std::tm local{};
        if (!localtime_r(&now, &local)) throw std::runtime_error("localtime_r failed");
        char buf[64];
        const auto n = std::strftime(buf, sizeof(buf), pattern, &local);
        return std::string(buf, n);
    });
    return cmd;
}

} // namespace

namespace demo {

void registerCommandSet(thumb::Processor& processor) {
    processor.addGroup("", {"textutils", "tu"}, "some useful text utils");
    // Any alias of a group works inside a path.
    processor.addGroup("tu", {"metrics", "metr", "mt"}, "calculate various string metrics");
    const auto frequent = processor.addGroup("", {"fr"}, "frequently used commands");

    const auto dst = processor.addCommand("tu", displaySampleText());
    processor.addCommand("textutils", removeCharacter());
    const auto cc = processor.addCommand("tu mt", countCharacters());
    const auto cw = processor.addCommand("textutils mt", countWords());
    processor.addCommand("textutils", repeatWord());
    processor.addCommand("tu", repeatPhrase());

    // The same bound commands are reachable from a second location.
    processor.attachCommand(frequent, dst);
    processor.attachCommand(frequent, cc);
    processor.attachCommand("tu", cw);

    processor.addCommand("", showDateTime());
    processor.addCommand("", thumb::help::makeHelpCommand(processor));

    // Handles avoid repeating paths.
    const auto calc = processor.addGroup(processor.registry().root(), {"calc"}, "do some calculus");
    processor.addCommand(calc, addValues());
    processor.addCommand(calc, divide());
}

} // namespace demo

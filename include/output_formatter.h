#pragma once

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <numeric_key.h>

enum class Mode {
    Label,
    Check
};

class OutputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr std::size_t LABEL_ARGUMENT_COUNT = 2;
constexpr std::string_view LABEL_PREFIX = "TEST: ";
constexpr std::string_view PASS_LINE = "  Pass (Result image matches reference)";
constexpr std::string_view DONE_LINE = "DONE!";

inline Mode select_mode(const std::size_t argumentCount) {
    return argumentCount == LABEL_ARGUMENT_COUNT ? Mode::Label : Mode::Check;
}

inline std::string_view trim_blanks(std::string_view line) {
    while (!line.empty() && detail::is_blank(line.front())) {
        line.remove_prefix(1);
    }
    while (!line.empty() && detail::is_blank(line.back())) {
        line.remove_suffix(1);
    }
    return line;
}

inline void write_label(std::ostream& out, const std::string_view line) {
    out << LABEL_PREFIX << line << '\n';
}

inline void write_check(std::ostream& out, const std::string_view line) {
    out << "Test case '" << line << "'..\n" << PASS_LINE << '\n';
}

inline void write_report(std::ostream& out, const Mode mode, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        switch (mode) {
            case Mode::Label:
                write_label(out, trim_blanks(line));
                break;
            case Mode::Check:
                write_check(out, trim_blanks(line));
                break;
        }
    }
    if (mode == Mode::Check) {
        out << DONE_LINE << '\n';
    }

    out.flush();
    if (!out) {
        throw OutputError("Can't write report to output stream");
    }
}

#pragma once

#include <cstddef>
#include <exception>
#include <ostream>
#include <line_sorter.h>
#include <output_formatter.h>

inline int run(const int argc, const char* const argv[], std::ostream& out, std::ostream& err) {
    if (argc < 2) {
        err << "Usage: " << (argc > 0 ? argv[0] : "sorted_report") << " <file> [<label-flag>]" << std::endl;
        return 1;
    }
    try {
        const auto lines = sort_file(argv[1]);
        write_report(out, select_mode(static_cast<std::size_t>(argc - 1)), lines);
    } catch (const std::exception& e) {
        err << "Exception while reporting: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

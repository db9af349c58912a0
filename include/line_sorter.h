#pragma once

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <numeric_key.h>

namespace fs = std::filesystem;

class FileAccessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class LineReader {
    FILE* file;
    const fs::path path;
    std::vector<char> buffer;

public:
    LineReader() = delete;
    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    explicit LineReader(const fs::path& path, const std::size_t size = 1 << 16)
        : file(nullptr), path(path), buffer(size) {
        if (size == 0) {
            throw std::invalid_argument("Line buffer size must be positive");
        }

        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            throw FileAccessError("Can't open: " + path.string() + ", " + strerror(EISDIR));
        }

        file = fopen(path.c_str(), "r");
        if (!file) {
            throw FileAccessError("Can't open: " + path.string() + ", " + strerror(errno));
        }
    }

    ~LineReader() {
        fclose(file);
    }

    // Every '\n'-terminated line, plus a final unterminated one if present.
    std::vector<std::string> read_all() {
        std::vector<std::string> lines;
        std::string current;
        bool pending = false;

        while (true) {
            const std::size_t available = fread(buffer.data(), 1, buffer.size(), file);
            for (std::size_t i = 0; i < available; ++i) {
                if (buffer[i] == '\n') {
                    lines.push_back(std::move(current));
                    current.clear();
                    pending = false;
                } else {
                    current += buffer[i];
                    pending = true;
                }
            }

            if (available < buffer.size() || feof(file)) {
                if (ferror(file)) {
                    throw FileAccessError("Can't read: " + path.string() + ", " + strerror(errno));
                }
                break;
            }
        }

        if (pending) {
            lines.push_back(std::move(current));
        }
        return lines;
    }
};

// Stable: lines with equal keys keep their input order.
inline void sort_numeric(std::vector<std::string>& lines) {
    std::vector<std::pair<NumericKey, std::size_t>> keys;
    keys.reserve(lines.size());
    for (std::size_t i = 0; i < lines.size(); ++i) {
        keys.emplace_back(parse_numeric_key(lines[i]), i);
    }

    std::stable_sort(keys.begin(), keys.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });

    std::vector<std::string> sorted;
    sorted.reserve(lines.size());
    for (const auto& entry : keys) {
        sorted.push_back(std::move(lines[entry.second]));
    }
    lines = std::move(sorted);
}

inline std::vector<std::string> read_lines(const fs::path& path) {
    LineReader reader{path};
    return reader.read_all();
}

inline std::vector<std::string> sort_file(const fs::path& path) {
    auto lines = read_lines(path);
    sort_numeric(lines);
    return lines;
}

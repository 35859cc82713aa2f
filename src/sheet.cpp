/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/sheet.hpp"
#include "devcat/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace devcat {

namespace {

constexpr std::size_t kMaxPreview = 160;
constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

std::string preview(const std::string& line) {
    if (line.size() <= kMaxPreview) return line;
    return line.substr(0, kMaxPreview) + "...";
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void stripLineEnding(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

LoadResult fail(const std::string& message) {
    LoadResult result;
    result.error = message;
    return result;
}

// Index of the named column, or -1
int findColumn(const std::vector<std::string>& header, const char* name) {
    const std::string wanted = toLowerCopy(name);
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (toLowerCopy(header[i]) == wanted) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

}

bool Sheet::splitLine(const std::string& line, std::vector<std::string>& out, std::string& error) {
    out.clear();

    std::string field;
    field.reserve(line.size());
    bool inQuotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            inQuotes = true;
        } else if (c == ',') {
            out.push_back(trim(field));
            field.clear();
        } else {
            field.push_back(c);
        }
    }

    if (inQuotes) {
        error = "Unterminated quoted field.";
        return false;
    }

    out.push_back(trim(field));
    return true;
}

LoadResult Sheet::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return fail("File not found: " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return fail("Failed to open file: " + path.string());
    }

    LOG_DEBUG("Reading device sheet: " + path.string());
    return parse(in, path.string());
}

LoadResult Sheet::parse(std::istream& in, const std::string& sourceName) {
    std::string line;
    std::size_t lineNo = 0;
    bool haveHeader = false;

    // Skip leading blank lines
    while (std::getline(in, line)) {
        ++lineNo;
        stripLineEnding(line);
        if (lineNo == 1 && line.compare(0, 3, kUtf8Bom) == 0) {
            line.erase(0, 3);
        }
        if (!trim(line).empty()) {
            haveHeader = true;
            break;
        }
    }

    if (!haveHeader) {
        return fail(sourceName + ": empty file (no header row)");
    }

    std::vector<std::string> header;
    std::string err;
    if (!splitLine(line, header, err)) {
        return fail(sourceName + ": header parse error at line " + std::to_string(lineNo) +
                    ": " + err + " Line: " + preview(line));
    }

    const int idCol = findColumn(header, kDeviceIdColumn);
    const int nameCol = findColumn(header, kDeviceNameColumn);
    const int categoryCol = findColumn(header, kNewCategoryColumn);

    std::vector<std::string> missing;
    if (idCol < 0) missing.emplace_back(kDeviceIdColumn);
    if (nameCol < 0) missing.emplace_back(kDeviceNameColumn);
    if (categoryCol < 0) missing.emplace_back(kNewCategoryColumn);
    if (!missing.empty()) {
        std::string names;
        for (const auto& m : missing) {
            if (!names.empty()) names += ", ";
            names += m;
        }
        return fail(sourceName + ": missing required column(s) " + names +
                    " in header at line " + std::to_string(lineNo) + ". Got: " + preview(line));
    }

    const std::size_t needed =
        static_cast<std::size_t>(std::max({idCol, nameCol, categoryCol})) + 1;

    LoadResult result;
    std::vector<std::string> cells;

    while (std::getline(in, line)) {
        ++lineNo;
        stripLineEnding(line);
        if (trim(line).empty()) continue;

        const std::size_t startLine = lineNo;

        // A quoted field may span physical lines
        while (!splitLine(line, cells, err)) {
            std::string next;
            if (!std::getline(in, next)) {
                return fail(sourceName + ": CSV parse error at line " + std::to_string(startLine) +
                            ": " + err + " Line: " + preview(line));
            }
            ++lineNo;
            stripLineEnding(next);
            line += '\n';
            line += next;
        }

        if (cells.size() < needed) {
            return fail(sourceName + ": wrong column count at line " + std::to_string(startLine) +
                        " (expected at least " + std::to_string(needed) + ", got " +
                        std::to_string(cells.size()) + "). Line: " + preview(line));
        }

        DeviceRecord record;
        record.deviceId = cells[static_cast<std::size_t>(idCol)];
        record.deviceName = cells[static_cast<std::size_t>(nameCol)];
        record.newCategory = cells[static_cast<std::size_t>(categoryCol)];
        record.line = startLine;
        result.records.push_back(std::move(record));
    }

    if (in.bad()) {
        return fail(sourceName + ": read error after line " + std::to_string(lineNo));
    }

    LOG_DEBUG("Loaded " + std::to_string(result.records.size()) + " device rows from " + sourceName);
    result.ok = true;
    return result;
}

}

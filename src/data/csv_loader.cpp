#include "peerbench/data/csv_loader.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace peerbench {

// ===== CsvTable =====

std::optional<size_t> CsvTable::column_index(const std::string& name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return i;
        }
    }
    return std::nullopt;
}

size_t CsvTable::require_column(const std::string& name) const {
    auto index = column_index(name);
    if (!index) {
        throw std::runtime_error("Missing column '" + name + "' in " + path);
    }
    return *index;
}

std::string CsvTable::location(size_t row) const {
    return path + ":" + std::to_string(line_numbers[row]);
}

// ===== Public API =====

CsvTable CsvLoader::load(const std::string& path, const CsvOptions& opts) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !file.read(buffer.data(), size)) {
        throw std::runtime_error("Failed to read file: " + path);
    }

    return parse(buffer, path, opts);
}

CsvTable CsvLoader::parse(const std::string& content, const std::string& path,
                          const CsvOptions& opts) {
    CsvTable table;
    table.path = path;

    std::istringstream stream(content);
    std::string line;
    size_t line_number = 0;

    for (int i = 0; i < opts.skip_rows; ++i) {
        if (!std::getline(stream, line)) {
            throw std::runtime_error("Not enough rows to skip in " + path);
        }
        ++line_number;
    }

    auto is_blank_or_comment = [&opts](const std::string& text) {
        size_t first = text.find_first_not_of(" \t\r\n");
        return first == std::string::npos || text[first] == opts.comment;
    };

    // Header
    if (opts.has_header) {
        bool found = false;
        while (std::getline(stream, line)) {
            ++line_number;
            if (is_blank_or_comment(line)) {
                continue;
            }
            for (auto& name : split_line(line, opts.delimiter)) {
                table.header.push_back(trim(name));
            }
            found = true;
            break;
        }
        if (!found) {
            throw std::runtime_error("Empty file or missing header: " + path);
        }
    }

    // Data rows
    while (std::getline(stream, line)) {
        ++line_number;
        if (is_blank_or_comment(line)) {
            continue;
        }

        auto fields = split_line(line, opts.delimiter);
        for (auto& field : fields) {
            field = trim(field);
        }

        const size_t expected = opts.has_header ? table.header.size()
                                                : (table.rows.empty() ? fields.size()
                                                                      : table.rows[0].size());
        if (fields.size() != expected) {
            throw std::runtime_error("Malformed row at " + path + ":" + std::to_string(line_number) +
                                     " (expected " + std::to_string(expected) +
                                     " fields, got " + std::to_string(fields.size()) + ")");
        }

        table.rows.push_back(std::move(fields));
        table.line_numbers.push_back(line_number);
    }

    if (!opts.has_header && !table.rows.empty()) {
        for (size_t i = 0; i < table.rows[0].size(); ++i) {
            table.header.push_back("column_" + std::to_string(i));
        }
    }

    return table;
}

bool CsvLoader::try_parse_double(const std::string& str, double& out) {
    if (str.empty()) {
        return false;
    }

    try {
        size_t pos;
        out = std::stod(str, &pos);
        // Check if entire string was consumed
        return pos == str.size();
    } catch (const std::logic_error&) {
        // std::invalid_argument or std::out_of_range
        return false;
    }
}

bool CsvLoader::try_parse_int64(const std::string& str, int64_t& out) {
    if (str.empty()) {
        return false;
    }

    try {
        size_t pos;
        out = std::stoll(str, &pos);
        return pos == str.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

std::vector<std::string> CsvLoader::split_line(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (c == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                // Escaped quote inside a quoted field
                field += '"';
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (c == delimiter && !in_quotes) {
            fields.push_back(field);
            field.clear();
        } else if (c == '\r' || c == '\n') {
            break;
        } else {
            field += c;
        }
    }

    fields.push_back(field);
    return fields;
}

std::string CsvLoader::trim(const std::string& value) {
    std::string result = value;
    result.erase(0, result.find_first_not_of(" \t\r\n"));
    result.erase(result.find_last_not_of(" \t\r\n") + 1);
    if (result.size() >= 2 && result.front() == '"' && result.back() == '"') {
        result = result.substr(1, result.size() - 2);
    }
    return result;
}

// ===== Line items =====

std::shared_ptr<LineItemStore> load_line_items_csv(const std::string& path, const CsvOptions& opts) {
    CsvTable table = CsvLoader::load(path, opts);

    const size_t entity_col = table.require_column("entity_id");
    const size_t period_col = table.require_column("period");
    const size_t line_col = table.require_column("line");
    const size_t column_col = table.require_column("column");
    const size_t value_col = table.require_column("value");

    LineItemStore::Builder builder;
    size_t skipped = 0;

    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];

        if (row[value_col].empty()) {
            ++skipped;
            continue;
        }

        int64_t period = 0;
        if (!CsvLoader::try_parse_int64(row[period_col], period)) {
            throw std::runtime_error("Invalid period '" + row[period_col] + "' at " + table.location(r));
        }

        double value = 0.0;
        if (!CsvLoader::try_parse_double(row[value_col], value)) {
            throw std::runtime_error("Invalid value '" + row[value_col] + "' at " + table.location(r));
        }

        if (row[entity_col].empty() || row[line_col].empty() || row[column_col].empty()) {
            throw std::runtime_error("Empty key field at " + table.location(r));
        }

        builder.add(row[entity_col], static_cast<Period>(period), row[line_col],
                    row[column_col], value);
    }

    std::cout << "[STORE] Loaded " << builder.size() << " line items from " << path;
    if (skipped > 0) {
        std::cout << " (" << skipped << " empty cells skipped)";
    }
    std::cout << std::endl;

    return builder.build(path);
}

} // namespace peerbench

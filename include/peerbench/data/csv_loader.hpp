#pragma once

#include "peerbench/data/line_item_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerbench {

/// CSV loading options
struct CsvOptions {
    char delimiter = ',';           ///< Field delimiter
    bool has_header = true;         ///< First row is header
    int skip_rows = 0;              ///< Rows to skip before header
    char comment = '#';             ///< Lines starting with this are ignored
};

/// Parsed CSV file: trimmed header plus string cells
struct CsvTable {
    std::string path;
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> line_numbers;   ///< 1-based source line of each row

    /// Index of a header column, if present
    std::optional<size_t> column_index(const std::string& name) const;

    /// Index of a header column
    /// @throws std::runtime_error if missing
    size_t require_column(const std::string& name) const;

    /// "path:line" for error messages
    std::string location(size_t row) const;
};

/// CSV Loader - small static helpers shared by all file loaders
class CsvLoader {
public:
    CsvLoader() = delete;  // Static class, no instances

    /// Load CSV file into a string table
    /// @throws std::runtime_error on I/O failure or malformed rows
    static CsvTable load(const std::string& path, const CsvOptions& opts = CsvOptions());

    /// Parse CSV content already in memory
    static CsvTable parse(const std::string& content, const std::string& path,
                          const CsvOptions& opts = CsvOptions());

    /// Parse a value; the whole string must be consumed
    static bool try_parse_double(const std::string& str, double& out);
    static bool try_parse_int64(const std::string& str, int64_t& out);

    /// Split CSV line into fields (quote aware)
    static std::vector<std::string> split_line(const std::string& line, char delimiter);

    /// Strip surrounding whitespace and quotes
    static std::string trim(const std::string& value);
};

/**
 * @brief Load line items from "entity_id,period,line,column,value"
 *
 * Empty value cells are skipped (the filing did not report the cell).
 *
 * @throws std::runtime_error on unreadable files or unparsable cells
 * @throws std::invalid_argument on duplicate line-item tuples
 */
std::shared_ptr<LineItemStore> load_line_items_csv(const std::string& path,
                                                   const CsvOptions& opts = CsvOptions());

} // namespace peerbench

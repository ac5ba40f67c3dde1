/**
 * PBT Reader - Read one generation table
 *
 * Validates the header (magic, version, CRC32), the column directory and each
 * column block on read. Every validation failure raises TableFormatError.
 *
 * Not thread-safe: one reader per loading thread.
 */

#pragma once

#include "table_format.hpp"
#include <fstream>
#include <string>
#include <vector>

namespace peerbench {
namespace pbt {

class TableReader {
public:
  /**
   * Open and validate a table file
   *
   * @throws StorageUnavailable if the file cannot be opened
   * @throws TableFormatError if header or directory are invalid
   */
  explicit TableReader(const std::string &filename);

  // Disable copy
  TableReader(const TableReader &) = delete;
  TableReader &operator=(const TableReader &) = delete;

  const TableHeader &get_header() const { return header_; }
  TableKind kind() const { return static_cast<TableKind>(header_.table_kind); }
  uint64_t row_count() const { return header_.row_count; }
  std::string generation_id() const;

  const std::vector<ColumnInfo> &columns() const { return columns_; }
  const ColumnInfo *find_column(const std::string &name) const;

  /**
   * Check table kind and required columns
   *
   * @throws TableFormatError on mismatch
   */
  void validate_schema(TableKind expected_kind) const;

  std::vector<double> read_float64(const std::string &name);
  std::vector<int64_t> read_int64(const std::string &name);
  std::vector<uint8_t> read_uint8(const std::string &name);
  std::vector<std::string> read_strings(const std::string &name);

private:
  void read_header();
  void read_directory();
  std::vector<uint8_t> read_column_bytes(const std::string &name,
                                         DataType expected);
  std::vector<uint8_t> decompress_block(const std::vector<uint8_t> &block,
                                        uint64_t uncompressed_size) const;
  void read_at(uint64_t offset, void *out, size_t size);

  std::string filename_;
  std::ifstream file_;
  uint64_t actual_file_size_;
  TableHeader header_;
  std::vector<ColumnInfo> columns_;
};

} // namespace pbt
} // namespace peerbench

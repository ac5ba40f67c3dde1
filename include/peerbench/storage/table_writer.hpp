/**
 * PBT Writer - Write one generation table
 *
 * Features:
 * - One ZSTD-compressed block per column
 * - CRC32 per column and for the header
 * - Header written last, so partial files never validate
 */

#pragma once

#include "table_format.hpp"
#include <fstream>
#include <string>
#include <vector>

namespace peerbench {
namespace pbt {

class TableWriter {
public:
  /**
   * Create table writer
   *
   * @param filename Output file path
   * @param kind Table kind stored in the header
   * @param generation_id Generation the rows belong to
   * @param compression_level ZSTD compression level (1-22, default: 3)
   * @throws std::runtime_error if the file cannot be created
   */
  TableWriter(const std::string &filename, TableKind kind,
              const std::string &generation_id, int compression_level = 3);

  /// Closes the file; an unfinalized table stays invalid
  ~TableWriter();

  // Disable copy
  TableWriter(const TableWriter &) = delete;
  TableWriter &operator=(const TableWriter &) = delete;

  void add_float64_column(const std::string &name,
                          const std::vector<double> &values);
  void add_int64_column(const std::string &name,
                        const std::vector<int64_t> &values);
  void add_uint8_column(const std::string &name,
                        const std::vector<uint8_t> &values);
  void add_string_column(const std::string &name,
                         const std::vector<std::string> &values);

  /**
   * Write the column directory and header, flush and close
   *
   * @throws std::runtime_error on write failure
   */
  void finalize();

  uint64_t get_file_size() const { return current_offset_; }
  double get_compression_ratio() const;

private:
  void write_column(const std::string &name, DataType type, const void *data,
                    size_t data_size, uint64_t value_count);
  void write_directory();
  void write_bytes(const void *data, size_t size);
  std::vector<uint8_t> compress_data(const void *data, size_t size) const;

  std::string filename_;
  std::ofstream file_;
  TableHeader header_;
  std::vector<ColumnInfo> columns_;
  std::vector<uint8_t> directory_bytes_;
  int compression_level_;
  bool has_rows_;

  uint64_t current_offset_;
  uint64_t total_uncompressed_;
  uint64_t total_compressed_;
};

} // namespace pbt
} // namespace peerbench

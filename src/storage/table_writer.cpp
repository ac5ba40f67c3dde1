/**
 * PBT Writer Implementation
 */

#include "peerbench/storage/table_writer.hpp"
#include <cstring>
#include <ctime>
#include <stdexcept>

// ZSTD compression (conditional)
#ifdef HAVE_ZSTD
#include <zstd.h>
#else
// Fallback: no compression
#pragma message("Warning: ZSTD not available, compression disabled")
#endif

namespace peerbench {
namespace pbt {

TableWriter::TableWriter(const std::string &filename, TableKind kind,
                         const std::string &generation_id,
                         int compression_level)
    : filename_(filename), compression_level_(compression_level),
      has_rows_(false), current_offset_(0), total_uncompressed_(0),
      total_compressed_(0) {
  file_.open(filename_, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open file for writing: " + filename_);
  }

  if (generation_id.size() >= sizeof(header_.generation_id)) {
    throw std::invalid_argument("Generation id too long: " + generation_id);
  }

  header_.table_kind = static_cast<uint8_t>(kind);
#ifdef HAVE_ZSTD
  header_.compression_type = static_cast<uint8_t>(CompressionType::ZSTD);
#else
  header_.compression_type = static_cast<uint8_t>(CompressionType::NONE);
#endif
  header_.compression_level = static_cast<uint8_t>(compression_level_);
  header_.creation_time = static_cast<uint64_t>(std::time(nullptr));
  std::strncpy(header_.generation_id, generation_id.c_str(),
               sizeof(header_.generation_id) - 1);
  std::strncpy(header_.creator, "peerbench", sizeof(header_.creator) - 1);

  // Reserve space for header (written last)
  std::vector<char> placeholder(HEADER_SIZE, 0);
  file_.write(placeholder.data(), placeholder.size());
  current_offset_ = HEADER_SIZE;
}

TableWriter::~TableWriter() {
  if (file_.is_open()) {
    file_.close();
  }
}

void TableWriter::add_float64_column(const std::string &name,
                                     const std::vector<double> &values) {
  write_column(name, DataType::FLOAT64, values.data(),
               values.size() * sizeof(double), values.size());
}

void TableWriter::add_int64_column(const std::string &name,
                                   const std::vector<int64_t> &values) {
  write_column(name, DataType::INT64, values.data(),
               values.size() * sizeof(int64_t), values.size());
}

void TableWriter::add_uint8_column(const std::string &name,
                                   const std::vector<uint8_t> &values) {
  write_column(name, DataType::UINT8, values.data(), values.size(),
               values.size());
}

void TableWriter::add_string_column(const std::string &name,
                                    const std::vector<std::string> &values) {
  // Serialized as [u32 length][bytes] per value
  std::vector<uint8_t> buffer;
  for (const auto &value : values) {
    uint32_t len = static_cast<uint32_t>(value.size());
    const auto *len_bytes = reinterpret_cast<const uint8_t *>(&len);
    buffer.insert(buffer.end(), len_bytes, len_bytes + sizeof(len));
    buffer.insert(buffer.end(), value.begin(), value.end());
  }
  write_column(name, DataType::STRING, buffer.data(), buffer.size(),
               values.size());
}

void TableWriter::finalize() {
  if (!file_.is_open()) {
    throw std::runtime_error("Table already finalized: " + filename_);
  }

  header_.column_directory_offset = current_offset_;
  write_directory();

  header_.file_size = current_offset_;
  header_.column_count = static_cast<uint32_t>(columns_.size());

  header_.header_crc32 = 0; // Exclude checksum field itself
  header_.header_crc32 = calculate_crc32(&header_, sizeof(header_));

  file_.seekp(0);
  file_.write(reinterpret_cast<const char *>(&header_), sizeof(header_));
  file_.flush();

  if (!file_.good()) {
    file_.close();
    throw std::runtime_error("Failed to write table: " + filename_);
  }
  file_.close();
}

double TableWriter::get_compression_ratio() const {
  if (total_compressed_ == 0)
    return 0.0;
  return static_cast<double>(total_uncompressed_) /
         static_cast<double>(total_compressed_);
}

// Private helper methods

void TableWriter::write_column(const std::string &name, DataType type,
                               const void *data, size_t data_size,
                               uint64_t value_count) {
  if (!file_.is_open()) {
    throw std::runtime_error("Table already finalized: " + filename_);
  }
  if (!has_rows_) {
    header_.row_count = value_count;
    has_rows_ = true;
  } else if (header_.row_count != value_count) {
    throw std::invalid_argument("Column '" + name + "' has " +
                                std::to_string(value_count) +
                                " values, expected " +
                                std::to_string(header_.row_count));
  }

  std::vector<uint8_t> compressed = compress_data(data, data_size);

  ColumnInfo info;
  info.name = name;
  info.data_type = type;
  info.offset = current_offset_;
  info.compressed_size = compressed.size();
  info.uncompressed_size = data_size;
  info.value_count = value_count;
  info.crc32 = calculate_crc32(data, data_size);
  columns_.push_back(info);

  write_bytes(compressed.data(), compressed.size());
  total_uncompressed_ += data_size;
  total_compressed_ += compressed.size();
}

void TableWriter::write_directory() {
  std::vector<uint8_t> buffer;
  auto append = [&buffer](const void *data, size_t size) {
    const auto *bytes = static_cast<const uint8_t *>(data);
    buffer.insert(buffer.end(), bytes, bytes + size);
  };

  for (const auto &col : columns_) {
    uint32_t name_len = static_cast<uint32_t>(col.name.size());
    append(&name_len, sizeof(name_len));
    append(col.name.data(), name_len);
    append(&col.data_type, sizeof(col.data_type));
    append(&col.offset, sizeof(col.offset));
    append(&col.compressed_size, sizeof(col.compressed_size));
    append(&col.uncompressed_size, sizeof(col.uncompressed_size));
    append(&col.value_count, sizeof(col.value_count));
    append(&col.crc32, sizeof(col.crc32));
  }

  header_.directory_crc32 = calculate_crc32(buffer.data(), buffer.size());
  write_bytes(buffer.data(), buffer.size());
}

void TableWriter::write_bytes(const void *data, size_t size) {
  file_.write(static_cast<const char *>(data),
              static_cast<std::streamsize>(size));
  if (!file_.good()) {
    throw std::runtime_error("Write failed: " + filename_);
  }
  current_offset_ += size;
}

std::vector<uint8_t> TableWriter::compress_data(const void *data,
                                                size_t size) const {
#ifdef HAVE_ZSTD
  size_t max_compressed_size = ZSTD_compressBound(size);
  std::vector<uint8_t> compressed(max_compressed_size);

  size_t compressed_size = ZSTD_compress(compressed.data(), max_compressed_size,
                                         data, size, compression_level_);

  if (ZSTD_isError(compressed_size)) {
    throw std::runtime_error("ZSTD compression failed: " +
                             std::string(ZSTD_getErrorName(compressed_size)));
  }

  compressed.resize(compressed_size);
  return compressed;
#else
  // No compression available - just copy data
  std::vector<uint8_t> result(size);
  if (size > 0) {
    std::memcpy(result.data(), data, size);
  }
  return result;
#endif
}

} // namespace pbt
} // namespace peerbench

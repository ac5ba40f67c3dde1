/**
 * PBT Reader Implementation
 */

#include "peerbench/storage/table_reader.hpp"
#include "peerbench/core/errors.hpp"
#include <cstdint>
#include <cstring>

// ZSTD decompression (conditional)
#ifdef HAVE_ZSTD
#include <zstd.h>
#endif

namespace peerbench {
namespace pbt {

namespace {

/// Bytes per value of a fixed-width type, 0 for strings and unknown types
uint64_t value_width(DataType type) {
  switch (type) {
  case DataType::FLOAT64:
    return sizeof(double);
  case DataType::INT64:
    return sizeof(int64_t);
  case DataType::UINT8:
    return sizeof(uint8_t);
  case DataType::STRING:
    break;
  }
  return 0;
}

} // namespace

TableReader::TableReader(const std::string &filename)
    : filename_(filename), actual_file_size_(0) {
  file_.open(filename_, std::ios::binary | std::ios::in | std::ios::ate);
  if (!file_.is_open()) {
    throw StorageUnavailable("Failed to open file: " + filename_);
  }
  actual_file_size_ = static_cast<uint64_t>(file_.tellg());

  read_header();
  read_directory();
}

std::string TableReader::generation_id() const {
  return std::string(header_.generation_id,
                     strnlen(header_.generation_id, sizeof(header_.generation_id)));
}

const ColumnInfo *TableReader::find_column(const std::string &name) const {
  for (const auto &col : columns_) {
    if (col.name == name) {
      return &col;
    }
  }
  return nullptr;
}

void TableReader::validate_schema(TableKind expected_kind) const {
  if (kind() != expected_kind) {
    throw TableFormatError(filename_ + ": expected " +
                           std::string(to_string(expected_kind)) +
                           " table, found kind " +
                           std::to_string(header_.table_kind));
  }
  for (const auto &expected : schema_for(expected_kind)) {
    const ColumnInfo *col = find_column(expected.name);
    if (!col) {
      throw TableFormatError(filename_ + ": missing column '" +
                             std::string(expected.name) + "'");
    }
    if (col->data_type != expected.type) {
      throw TableFormatError(filename_ + ": column '" +
                             std::string(expected.name) + "' has wrong type");
    }
    if (col->value_count != header_.row_count) {
      throw TableFormatError(filename_ + ": column '" +
                             std::string(expected.name) + "' has " +
                             std::to_string(col->value_count) + " values, expected " +
                             std::to_string(header_.row_count));
    }
  }
}

std::vector<double> TableReader::read_float64(const std::string &name) {
  auto bytes = read_column_bytes(name, DataType::FLOAT64);
  std::vector<double> values(bytes.size() / sizeof(double));
  if (!values.empty()) {
    std::memcpy(values.data(), bytes.data(), values.size() * sizeof(double));
  }
  return values;
}

std::vector<int64_t> TableReader::read_int64(const std::string &name) {
  auto bytes = read_column_bytes(name, DataType::INT64);
  std::vector<int64_t> values(bytes.size() / sizeof(int64_t));
  if (!values.empty()) {
    std::memcpy(values.data(), bytes.data(), values.size() * sizeof(int64_t));
  }
  return values;
}

std::vector<uint8_t> TableReader::read_uint8(const std::string &name) {
  return read_column_bytes(name, DataType::UINT8);
}

std::vector<std::string> TableReader::read_strings(const std::string &name) {
  auto bytes = read_column_bytes(name, DataType::STRING);
  const ColumnInfo *col = find_column(name);

  std::vector<std::string> values;
  values.reserve(col->value_count);

  size_t pos = 0;
  for (uint64_t i = 0; i < col->value_count; ++i) {
    uint32_t len = 0;
    if (pos + sizeof(len) > bytes.size()) {
      throw TableFormatError(filename_ + ": truncated string column '" + name + "'");
    }
    std::memcpy(&len, bytes.data() + pos, sizeof(len));
    pos += sizeof(len);
    if (pos + len > bytes.size()) {
      throw TableFormatError(filename_ + ": truncated string column '" + name + "'");
    }
    values.emplace_back(reinterpret_cast<const char *>(bytes.data() + pos), len);
    pos += len;
  }
  return values;
}

// Private helper methods

void TableReader::read_header() {
  if (actual_file_size_ < HEADER_SIZE) {
    throw TableFormatError(filename_ + ": file too small for header");
  }
  read_at(0, &header_, sizeof(header_));

  if (header_.magic != PBT_MAGIC) {
    throw TableFormatError(filename_ + ": bad magic number");
  }
  if (header_.version != PBT_VERSION) {
    throw TableFormatError(filename_ + ": unsupported version");
  }

  uint32_t stored_crc = header_.header_crc32;
  TableHeader copy = header_;
  copy.header_crc32 = 0;
  if (calculate_crc32(&copy, sizeof(copy)) != stored_crc) {
    throw TableFormatError(filename_ + ": header checksum mismatch");
  }
  if (header_.file_size != actual_file_size_) {
    throw TableFormatError(filename_ + ": file size mismatch");
  }

#ifndef HAVE_ZSTD
  if (header_.compression_type == static_cast<uint8_t>(CompressionType::ZSTD)) {
    throw TableFormatError(filename_ + ": ZSTD-compressed but ZSTD support is not built in");
  }
#endif
}

void TableReader::read_directory() {
  const uint64_t offset = header_.column_directory_offset;
  if (offset < HEADER_SIZE || offset > header_.file_size) {
    throw TableFormatError(filename_ + ": bad column directory offset");
  }

  std::vector<uint8_t> buffer(static_cast<size_t>(header_.file_size - offset));
  if (!buffer.empty()) {
    read_at(offset, buffer.data(), buffer.size());
  }
  if (calculate_crc32(buffer.data(), buffer.size()) != header_.directory_crc32) {
    throw TableFormatError(filename_ + ": column directory checksum mismatch");
  }

  size_t pos = 0;
  auto take = [&](void *out, size_t size) {
    if (pos + size > buffer.size()) {
      throw TableFormatError(filename_ + ": truncated column directory");
    }
    std::memcpy(out, buffer.data() + pos, size);
    pos += size;
  };

  for (uint32_t i = 0; i < header_.column_count; ++i) {
    ColumnInfo col;
    uint32_t name_len = 0;
    take(&name_len, sizeof(name_len));
    col.name.resize(name_len);
    take(col.name.data(), name_len);
    take(&col.data_type, sizeof(col.data_type));
    take(&col.offset, sizeof(col.offset));
    take(&col.compressed_size, sizeof(col.compressed_size));
    take(&col.uncompressed_size, sizeof(col.uncompressed_size));
    take(&col.value_count, sizeof(col.value_count));
    take(&col.crc32, sizeof(col.crc32));

    const uint64_t data_end = header_.column_directory_offset;
    if (col.offset < HEADER_SIZE || col.offset > data_end ||
        col.compressed_size > data_end - col.offset) {
      throw TableFormatError(filename_ + ": column '" + col.name + "' out of bounds");
    }

    // Fixed-width columns must hold exactly value_count values
    const uint64_t width = value_width(col.data_type);
    if (width == 0) {
      if (col.data_type != DataType::STRING) {
        throw TableFormatError(filename_ + ": column '" + col.name + "' has unknown type");
      }
    } else if (col.value_count > UINT64_MAX / width ||
               col.uncompressed_size != col.value_count * width) {
      throw TableFormatError(filename_ + ": column '" + col.name + "' size " +
                             std::to_string(col.uncompressed_size) + " does not match " +
                             std::to_string(col.value_count) + " values");
    }
    columns_.push_back(std::move(col));
  }
}

std::vector<uint8_t> TableReader::read_column_bytes(const std::string &name,
                                                    DataType expected) {
  const ColumnInfo *col = find_column(name);
  if (!col) {
    throw TableFormatError(filename_ + ": column not found: " + name);
  }
  if (col->data_type != expected) {
    throw TableFormatError(filename_ + ": column '" + name + "' has wrong type");
  }

  std::vector<uint8_t> block(static_cast<size_t>(col->compressed_size));
  if (!block.empty()) {
    read_at(col->offset, block.data(), block.size());
  }

  std::vector<uint8_t> data = decompress_block(block, col->uncompressed_size);
  if (calculate_crc32(data.data(), data.size()) != col->crc32) {
    throw TableFormatError(filename_ + ": checksum mismatch in column '" + name + "'");
  }
  return data;
}

std::vector<uint8_t>
TableReader::decompress_block(const std::vector<uint8_t> &block,
                              uint64_t uncompressed_size) const {
  std::vector<uint8_t> result(static_cast<size_t>(uncompressed_size));
  if (uncompressed_size == 0) {
    return result;
  }

  if (header_.compression_type == static_cast<uint8_t>(CompressionType::NONE)) {
    if (block.size() != uncompressed_size) {
      throw TableFormatError(filename_ + ": block size mismatch");
    }
    std::memcpy(result.data(), block.data(), block.size());
    return result;
  }

#ifdef HAVE_ZSTD
  size_t decompressed_size = ZSTD_decompress(result.data(), result.size(),
                                             block.data(), block.size());

  if (ZSTD_isError(decompressed_size)) {
    throw TableFormatError(filename_ + ": ZSTD decompression failed: " +
                           std::string(ZSTD_getErrorName(decompressed_size)));
  }
  if (decompressed_size != uncompressed_size) {
    throw TableFormatError(filename_ + ": decompressed size mismatch");
  }
  return result;
#else
  throw TableFormatError(filename_ + ": ZSTD support is not built in");
#endif
}

void TableReader::read_at(uint64_t offset, void *out, size_t size) {
  file_.clear();
  file_.seekg(static_cast<std::streamoff>(offset));
  file_.read(static_cast<char *>(out), static_cast<std::streamsize>(size));
  if (!file_) {
    throw StorageUnavailable("Read failed: " + filename_);
  }
}

} // namespace pbt
} // namespace peerbench

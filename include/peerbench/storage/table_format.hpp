/**
 * PBT Format - peerbench columnar table
 *
 * Binary container for one generation table (kpi_values or
 * benchmark_stats).
 *
 * Layout:
 * - [1] Header (512 bytes): magic, version, table kind, row count,
 *       generation id, checksums
 * - [2] Column blocks: one ZSTD-compressed block per column
 * - [3] Column directory: name, type, offset, sizes and CRC32 per column
 *
 * A file is only valid once the header has been written last by finalize(),
 * so an interrupted write never produces a readable table.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace peerbench {
namespace pbt {

// ==============================================================================
// Constants
// ==============================================================================

constexpr uint32_t PBT_MAGIC = 0x42544250;   // "PBTB" in little-endian
constexpr uint32_t PBT_VERSION = 0x00010000; // v1.0.0
constexpr uint32_t HEADER_SIZE = 512;

// ==============================================================================
// Enums
// ==============================================================================

enum class DataType : uint8_t { FLOAT64 = 1, INT64 = 2, STRING = 3, UINT8 = 4 };

enum class CompressionType : uint8_t { NONE = 0, ZSTD = 1 };

enum class TableKind : uint8_t { KPI_VALUES = 1, BENCHMARK_STATS = 2 };

const char *to_string(TableKind kind);

// ==============================================================================
// [1] Header Structure (512 bytes)
// ==============================================================================

#pragma pack(push, 1)

struct TableHeader {
  // Magic & Version (16 bytes)
  uint32_t magic;       // "PBTB"
  uint32_t version;     // 0x00010000 (v1.0)
  uint32_t header_size; // 512 bytes
  uint8_t table_kind;   // TableKind enum
  uint8_t compression_type;
  uint8_t compression_level;
  uint8_t reserved1;

  // File Info (48 bytes)
  uint64_t file_size;
  uint64_t row_count;
  uint32_t column_count;
  uint32_t reserved2;
  uint64_t creation_time; // Unix timestamp
  uint64_t column_directory_offset;
  uint32_t header_crc32; // Computed with this field zeroed
  uint32_t directory_crc32;

  // Identity (96 bytes)
  char generation_id[64];
  char creator[32];

  // Reserved for future use (fill to 512)
  uint8_t reserved[352];

  TableHeader() {
    std::memset(this, 0, sizeof(TableHeader));
    magic = PBT_MAGIC;
    version = PBT_VERSION;
    header_size = HEADER_SIZE;
  }
};

static_assert(sizeof(TableHeader) == HEADER_SIZE, "Header must be exactly 512 bytes");

#pragma pack(pop)

// ==============================================================================
// [3] Column Directory
// ==============================================================================

struct ColumnInfo {
  std::string name;
  DataType data_type;
  uint64_t offset;            // Byte offset of the column block
  uint64_t compressed_size;   // Block size on disk
  uint64_t uncompressed_size; // Serialized size before compression
  uint64_t value_count;
  uint32_t crc32;             // CRC32 of the uncompressed bytes

  ColumnInfo()
      : data_type(DataType::FLOAT64), offset(0), compressed_size(0),
        uncompressed_size(0), value_count(0), crc32(0) {}
};

// ==============================================================================
// Table Schemas
// ==============================================================================

struct ColumnSpec {
  const char *name;
  DataType type;
};

/// entity_id, period, kpi_key, value, has_value
const std::vector<ColumnSpec> &kpi_values_schema();

/// kpi_key, scope, scope_key, period, p25, median, p75, mean, sample_count
const std::vector<ColumnSpec> &benchmark_stats_schema();

const std::vector<ColumnSpec> &schema_for(TableKind kind);

// ==============================================================================
// Checksums
// ==============================================================================

/// CRC32 (IEEE 802.3, reflected)
uint32_t calculate_crc32(const void *data, size_t size);

} // namespace pbt
} // namespace peerbench

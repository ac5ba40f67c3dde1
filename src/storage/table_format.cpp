/**
 * PBT Format - schemas and checksums
 */

#include "peerbench/storage/table_format.hpp"

namespace peerbench {
namespace pbt {

const char *to_string(TableKind kind) {
  switch (kind) {
  case TableKind::KPI_VALUES:
    return "kpi_values";
  case TableKind::BENCHMARK_STATS:
    return "benchmark_stats";
  }
  return "unknown";
}

const std::vector<ColumnSpec> &kpi_values_schema() {
  static const std::vector<ColumnSpec> schema = {
      {"entity_id", DataType::STRING},
      {"period", DataType::INT64},
      {"kpi_key", DataType::STRING},
      {"value", DataType::FLOAT64},
      {"has_value", DataType::UINT8},
  };
  return schema;
}

const std::vector<ColumnSpec> &benchmark_stats_schema() {
  static const std::vector<ColumnSpec> schema = {
      {"kpi_key", DataType::STRING},   {"scope", DataType::STRING},
      {"scope_key", DataType::STRING}, {"period", DataType::INT64},
      {"p25", DataType::FLOAT64},      {"median", DataType::FLOAT64},
      {"p75", DataType::FLOAT64},      {"mean", DataType::FLOAT64},
      {"sample_count", DataType::INT64},
  };
  return schema;
}

const std::vector<ColumnSpec> &schema_for(TableKind kind) {
  return kind == TableKind::KPI_VALUES ? kpi_values_schema()
                                       : benchmark_stats_schema();
}

uint32_t calculate_crc32(const void *data, size_t size) {
  uint32_t crc = 0xFFFFFFFF;
  const uint8_t *bytes = static_cast<const uint8_t *>(data);

  for (size_t i = 0; i < size; ++i) {
    crc ^= bytes[i];
    for (int j = 0; j < 8; ++j) {
      crc = (crc >> 1) ^ (0xEDB88320 & (0u - (crc & 1u)));
    }
  }

  return ~crc;
}

} // namespace pbt
} // namespace peerbench

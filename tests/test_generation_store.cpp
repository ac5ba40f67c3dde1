/**
 * @file test_generation_store.cpp
 * @brief Tests for PBT tables, generations and the on-disk generation store
 */

#include "peerbench/core/errors.hpp"
#include "peerbench/storage/generation.hpp"
#include "peerbench/storage/generation_store.hpp"
#include "peerbench/storage/table_format.hpp"
#include "peerbench/storage/table_reader.hpp"
#include "peerbench/storage/table_writer.hpp"
#include "test_fixtures.hpp"

#include <cassert>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

using namespace peerbench;
using namespace peerbench::testing;

namespace fs = std::filesystem;

namespace {

BenchmarkStat make_stat(double p25, double median, double p75, double mean, uint64_t n) {
    BenchmarkStat stat;
    stat.p25 = p25;
    stat.median = median;
    stat.p75 = p75;
    stat.mean = mean;
    stat.sample_count = n;
    return stat;
}

std::shared_ptr<const Generation> sample_generation(const std::string& id) {
    std::vector<KpiValueRecord> kpis = {
        {"310002", 2024, "current_ratio", 1.5},
        {"310001", 2024, "current_ratio", 5.76},
        {"311300", 2024, "current_ratio", std::nullopt},
        {"310001", 2024, "medicare_ccr", std::nullopt},
    };
    std::vector<BenchmarkRecord> benchmarks = {
        {BenchmarkKey("current_ratio", "by-region", "31", 2024), make_stat(2.565, 3.63, 4.695, 3.63, 2)},
        {BenchmarkKey("current_ratio", "all", "ALL", 2024), make_stat(1.825, 2.15, 3.955, 3.1366, 3)},
    };
    return std::make_shared<const Generation>(id, std::move(kpis), std::move(benchmarks));
}

/**
 * @brief Shrink one fixed-width column to a single value while keeping every
 * checksum valid, so only the size check can catch it
 */
void shrink_column_to_one_value(const std::string& path, const std::string& column) {
    std::vector<uint8_t> bytes;
    {
        std::ifstream in(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    pbt::TableHeader header;
    std::memcpy(&header, bytes.data(), sizeof(header));
    const size_t dir_start = static_cast<size_t>(header.column_directory_offset);

    size_t pos = dir_start;
    for (uint32_t i = 0; i < header.column_count; ++i) {
        uint32_t name_len = 0;
        std::memcpy(&name_len, &bytes[pos], sizeof(name_len));
        const std::string name(reinterpret_cast<const char*>(&bytes[pos + 4]), name_len);
        pos += 4 + name_len;

        const size_t data_type_at = pos;
        const size_t offset_at = data_type_at + 1;
        const size_t compressed_at = offset_at + 8;
        const size_t uncompressed_at = compressed_at + 8;
        const size_t crc_at = uncompressed_at + 16;

        if (name == column) {
            uint64_t block_offset = 0;
            std::memcpy(&block_offset, &bytes[offset_at], sizeof(block_offset));

            const uint64_t one_value = 8;
            std::memcpy(&bytes[uncompressed_at], &one_value, sizeof(one_value));
            if (header.compression_type == static_cast<uint8_t>(pbt::CompressionType::NONE)) {
                std::memcpy(&bytes[compressed_at], &one_value, sizeof(one_value));
                const uint32_t crc = pbt::calculate_crc32(&bytes[block_offset], 8);
                std::memcpy(&bytes[crc_at], &crc, sizeof(crc));
            }
        }
        pos = crc_at + 4;
    }

    header.directory_crc32 = pbt::calculate_crc32(&bytes[dir_start], bytes.size() - dir_start);
    header.header_crc32 = 0;
    header.header_crc32 = pbt::calculate_crc32(&header, sizeof(header));
    std::memcpy(bytes.data(), &header, sizeof(header));

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

void overwrite_bytes(const std::string& path, std::streamoff offset, const std::string& bytes) {
    std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
    file.seekp(offset);
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

} // namespace

// ============================================================================
// Generation
// ============================================================================

void test_generation_lookups() {
    std::cout << "Testing generation lookups... ";

    auto generation = sample_generation("gen-000001");
    assert(generation->kpi_row_count() == 4);
    assert(generation->non_null_kpi_count() == 2);
    assert(generation->benchmark_row_count() == 2);

    auto values = generation->find_kpis("310001", 2024);
    assert(values.size() == 2);
    assert(values.at("current_ratio") == KpiValue(5.76));
    assert(!values.at("medicare_ccr"));

    assert(generation->find_kpis("999999", 2024).empty());

    auto null_value = generation->find_kpi("311300", 2024, "current_ratio");
    assert(null_value.has_value());
    assert(!null_value->has_value());
    assert(!generation->find_kpi("311300", 2024, "net_income_margin"));

    auto stat = generation->find_benchmark(BenchmarkKey("current_ratio", "all", "ALL", 2024));
    assert(stat);
    assert(stat->median == 2.15);
    assert(!generation->find_benchmark(BenchmarkKey("current_ratio", "all", "ALL", 2023)));

    auto entities = generation->entities(2024);
    assert(entities.size() == 3);
    assert(entities[0] == "310001");

    std::cout << "PASSED\n";
}

void test_generation_checksum() {
    std::cout << "Testing generation checksum... ";

    auto a = sample_generation("gen-000001");
    auto b = sample_generation("gen-000002");
    // Id is not part of the content
    assert(a->content_checksum() == b->content_checksum());

    std::vector<KpiValueRecord> reordered(a->kpi_values().rbegin(), a->kpi_values().rend());
    std::vector<BenchmarkRecord> benchmarks = a->benchmark_stats();
    Generation c("gen-000003", reordered, benchmarks);
    assert(c.content_checksum() == a->content_checksum());

    reordered[0].value = 9.99;
    Generation d("gen-000004", reordered, benchmarks);
    assert(d.content_checksum() != a->content_checksum());

    std::cout << "PASSED\n";
}

void test_generation_duplicates() {
    std::cout << "Testing duplicate generation rows... ";

    std::vector<KpiValueRecord> kpis = {
        {"310001", 2024, "current_ratio", 1.0},
        {"310001", 2024, "current_ratio", 2.0},
    };
    bool threw = false;
    try {
        Generation("gen-000001", kpis, {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

// ============================================================================
// Tables
// ============================================================================

void test_table_roundtrip() {
    std::cout << "Testing table write and read... ";

    TempDir dir("pb-table");
    const std::string path = dir.file("table.pbt");
    {
        pbt::TableWriter writer(path, pbt::TableKind::KPI_VALUES, "gen-000007");
        writer.add_string_column("entity_id", {"310001", "050003"});
        writer.add_int64_column("period", {2024, 2023});
        writer.add_string_column("kpi_key", {"current_ratio", "current_ratio"});
        writer.add_float64_column("value", {5.76, 0.0});
        writer.add_uint8_column("has_value", {1, 0});
        writer.finalize();
    }

    pbt::TableReader reader(path);
    reader.validate_schema(pbt::TableKind::KPI_VALUES);
    assert(reader.kind() == pbt::TableKind::KPI_VALUES);
    assert(reader.row_count() == 2);
    assert(reader.generation_id() == "gen-000007");

    auto entities = reader.read_strings("entity_id");
    assert(entities[1] == "050003");
    assert(reader.read_int64("period")[1] == 2023);
    assert(reader.read_float64("value")[0] == 5.76);
    assert(reader.read_uint8("has_value")[1] == 0);

    bool threw = false;
    try {
        reader.validate_schema(pbt::TableKind::BENCHMARK_STATS);
    } catch (const TableFormatError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        reader.read_int64("value");
    } catch (const TableFormatError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_unfinalized_table_is_invalid() {
    std::cout << "Testing unfinalized table... ";

    TempDir dir("pb-table");
    const std::string path = dir.file("partial.pbt");
    {
        pbt::TableWriter writer(path, pbt::TableKind::KPI_VALUES, "gen-000001");
        writer.add_string_column("entity_id", {"310001"});
        // Destroyed without finalize()
    }

    bool threw = false;
    try {
        pbt::TableReader reader(path);
    } catch (const TableFormatError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        pbt::TableReader reader(dir.file("absent.pbt"));
    } catch (const StorageUnavailable&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

// ============================================================================
// Generation Store
// ============================================================================

void test_generation_ids() {
    std::cout << "Testing generation ids... ";

    assert(format_generation_id(42) == "gen-000042");
    assert(parse_generation_id("gen-000042") == std::optional<uint64_t>(42));
    assert(!parse_generation_id("gen-"));
    assert(!parse_generation_id("gen-12a"));
    assert(!parse_generation_id("other"));

    std::cout << "PASSED\n";
}

void test_publish_and_load() {
    std::cout << "Testing publish and load... ";

    TempDir dir("pb-gen");
    GenerationStore store(dir.path());

    StorageProbe empty = store.probe();
    assert(empty.reachable);
    assert(!empty.generation_id);
    assert(!empty.any_table_ready());
    assert(store.load(empty) == nullptr);

    const std::string id = store.next_generation_id();
    assert(id == "gen-000001");

    auto generation = sample_generation(id);
    store.publish(*generation);

    assert(store.current_generation_id() == std::optional<std::string>(id));
    assert(store.next_generation_id() == "gen-000002");

    // No temporary directories left behind
    for (const auto& entry : fs::directory_iterator(fs::path(dir.path()) / GenerationStore::GENERATIONS_DIR)) {
        assert(entry.path().filename().string()[0] != '.');
    }

    StorageProbe probe = store.probe();
    assert(probe.reachable);
    assert(probe.kpi_table_ready);
    assert(probe.benchmark_table_ready);

    auto loaded = store.load(probe);
    assert(loaded);
    assert(loaded->id() == id);
    assert(loaded->content_checksum() == generation->content_checksum());
    assert(loaded->kpi_values() == generation->kpi_values());
    assert(loaded->benchmark_stats() == generation->benchmark_stats());

    // Publishing the same id twice is refused
    bool threw = false;
    try {
        store.publish(*generation);
    } catch (const StorageUnavailable&) {
        threw = true;
    }
    assert(threw);
    assert(store.current_generation_id() == std::optional<std::string>(id));

    std::cout << "PASSED\n";
}

void test_probe_detects_damage() {
    std::cout << "Testing probe of damaged tables... ";

    TempDir dir("pb-gen");
    GenerationStore store(dir.path());
    store.publish(*sample_generation("gen-000001"));

    const fs::path gen_dir = fs::path(dir.path()) / GenerationStore::GENERATIONS_DIR / "gen-000001";

    // Corrupt the benchmark table's magic number
    overwrite_bytes((gen_dir / GenerationStore::BENCHMARK_TABLE_FILE).string(), 0, "XXXX");

    StorageProbe probe = store.probe();
    assert(probe.kpi_table_ready);
    assert(!probe.benchmark_table_ready);
    assert(!probe.detail.empty());

    auto partial = store.load(probe);
    assert(partial);
    assert(partial->has_kpi_table());
    assert(!partial->has_benchmark_table());

    // Missing kpi table
    fs::remove(gen_dir / GenerationStore::KPI_TABLE_FILE);
    probe = store.probe();
    assert(!probe.any_table_ready());

    // Unreachable root
    GenerationStore missing(dir.file("does-not-exist"));
    StorageProbe unreachable = missing.probe();
    assert(!unreachable.reachable);

    std::cout << "PASSED\n";
}

void test_column_size_mismatch_rejected() {
    std::cout << "Testing column size that disagrees with its value count... ";

    TempDir dir("pb-gen");
    GenerationStore store(dir.path());
    store.publish(*sample_generation("gen-000001"));

    const fs::path kpi_path =
        fs::path(dir.path()) / GenerationStore::GENERATIONS_DIR / "gen-000001" / GenerationStore::KPI_TABLE_FILE;
    shrink_column_to_one_value(kpi_path.string(), "value");

    bool threw = false;
    try {
        pbt::TableReader reader(kpi_path.string());
    } catch (const TableFormatError&) {
        threw = true;
    }
    assert(threw);

    StorageProbe probe = store.probe();
    assert(!probe.kpi_table_ready);
    assert(probe.benchmark_table_ready);

    auto partial = store.load(probe);
    assert(partial);
    assert(!partial->has_kpi_table());

    std::cout << "PASSED\n";
}

void test_prune() {
    std::cout << "Testing generation retention... ";

    TempDir dir("pb-gen");
    GenerationStore store(dir.path(), constants::DEFAULT_COMPRESSION_LEVEL, 2);

    for (int i = 0; i < 4; ++i) {
        store.publish(*sample_generation(store.next_generation_id()));
    }

    auto generations = store.list_generations();
    assert(generations.size() == 2);
    assert(generations[0] == "gen-000003");
    assert(generations[1] == "gen-000004");
    assert(store.current_generation_id() == std::optional<std::string>("gen-000004"));

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Generation Store Test Suite ===\n\n";

    try {
        test_generation_lookups();
        test_generation_checksum();
        test_generation_duplicates();

        std::cout << "\n";

        test_table_roundtrip();
        test_unfinalized_table_is_invalid();

        std::cout << "\n";

        test_generation_ids();
        test_publish_and_load();
        test_probe_detects_damage();
        test_column_size_mismatch_rejected();
        test_prune();

        std::cout << "\n=== All tests PASSED ===\n\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}

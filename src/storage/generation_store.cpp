#include "peerbench/storage/generation_store.hpp"
#include "peerbench/core/errors.hpp"
#include "peerbench/storage/table_reader.hpp"
#include "peerbench/storage/table_writer.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace peerbench {

namespace {

/// Open a table and run every structural check; throws on failure
void check_table(const std::string& path, pbt::TableKind kind, const std::string& generation_id) {
    pbt::TableReader reader(path);
    reader.validate_schema(kind);
    if (reader.generation_id() != generation_id) {
        throw TableFormatError(path + ": belongs to generation '" + reader.generation_id() + "'");
    }
}

std::vector<KpiValueRecord> read_kpi_table(const std::string& path) {
    pbt::TableReader reader(path);
    reader.validate_schema(pbt::TableKind::KPI_VALUES);

    auto entities = reader.read_strings("entity_id");
    auto periods = reader.read_int64("period");
    auto keys = reader.read_strings("kpi_key");
    auto values = reader.read_float64("value");
    auto has_value = reader.read_uint8("has_value");

    std::vector<KpiValueRecord> rows(entities.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i].entity_id = std::move(entities[i]);
        rows[i].period = static_cast<Period>(periods[i]);
        rows[i].kpi_key = std::move(keys[i]);
        if (has_value[i]) {
            rows[i].value = values[i];
        }
    }
    return rows;
}

std::vector<BenchmarkRecord> read_benchmark_table(const std::string& path) {
    pbt::TableReader reader(path);
    reader.validate_schema(pbt::TableKind::BENCHMARK_STATS);

    auto kpis = reader.read_strings("kpi_key");
    auto scopes = reader.read_strings("scope");
    auto scope_keys = reader.read_strings("scope_key");
    auto periods = reader.read_int64("period");
    auto p25 = reader.read_float64("p25");
    auto median = reader.read_float64("median");
    auto p75 = reader.read_float64("p75");
    auto mean = reader.read_float64("mean");
    auto counts = reader.read_int64("sample_count");

    std::vector<BenchmarkRecord> rows(kpis.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i].key = BenchmarkKey(std::move(kpis[i]), std::move(scopes[i]),
                                   std::move(scope_keys[i]), static_cast<Period>(periods[i]));
        rows[i].stat.p25 = p25[i];
        rows[i].stat.median = median[i];
        rows[i].stat.p75 = p75[i];
        rows[i].stat.mean = mean[i];
        rows[i].stat.sample_count = static_cast<uint64_t>(counts[i]);
    }
    return rows;
}

} // namespace

std::string format_generation_id(uint64_t sequence) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "gen-%06llu", static_cast<unsigned long long>(sequence));
    return buffer;
}

std::optional<uint64_t> parse_generation_id(const std::string& id) {
    const std::string prefix("gen-");
    if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    uint64_t sequence = 0;
    for (size_t i = prefix.size(); i < id.size(); ++i) {
        if (id[i] < '0' || id[i] > '9') {
            return std::nullopt;
        }
        sequence = sequence * 10 + static_cast<uint64_t>(id[i] - '0');
    }
    return sequence;
}

GenerationStore::GenerationStore(std::string root, int compression_level, size_t generations_to_keep)
    : root_(std::move(root))
    , compression_level_(compression_level)
    , generations_to_keep_(std::max<size_t>(generations_to_keep, 1))
{
}

std::string GenerationStore::generation_dir(const std::string& id) const {
    return (fs::path(root_) / GENERATIONS_DIR / id).string();
}

std::string GenerationStore::next_generation_id() const {
    uint64_t highest = 0;
    for (const auto& name : list_generations()) {
        if (auto sequence = parse_generation_id(name)) {
            highest = std::max(highest, *sequence);
        }
    }
    return format_generation_id(highest + 1);
}

// ============================================================================
// Publish
// ============================================================================

void GenerationStore::publish(const Generation& generation) {
    const fs::path generations = fs::path(root_) / GENERATIONS_DIR;
    const fs::path final_dir = generations / generation.id();
    const fs::path temp_dir = generations / ("." + generation.id() + ".tmp");

    std::error_code ec;
    fs::create_directories(generations, ec);
    if (ec) {
        throw StorageUnavailable("cannot create " + generations.string() + ": " + ec.message());
    }
    if (fs::exists(final_dir, ec)) {
        throw StorageUnavailable("generation directory already exists: " + final_dir.string());
    }

    fs::remove_all(temp_dir, ec);
    fs::create_directory(temp_dir, ec);
    if (ec) {
        throw StorageUnavailable("cannot create " + temp_dir.string() + ": " + ec.message());
    }

    try {
        write_tables(generation, temp_dir.string());
    } catch (const std::runtime_error& e) {
        std::error_code cleanup_ec;
        fs::remove_all(temp_dir, cleanup_ec);
        if (cleanup_ec) {
            std::cerr << "[STORE] Failed to remove " << temp_dir << ": " << cleanup_ec.message() << std::endl;
        }
        throw StorageUnavailable(std::string("writing generation ") + generation.id() + ": " + e.what());
    }

    fs::rename(temp_dir, final_dir, ec);
    if (ec) {
        throw StorageUnavailable("cannot move " + temp_dir.string() + " into place: " + ec.message());
    }

    write_current_marker(generation.id());

    std::cout << "[STORE] Published generation " << generation.id() << " ("
              << generation.kpi_row_count() << " KPI rows, "
              << generation.benchmark_row_count() << " benchmark rows)" << std::endl;

    size_t removed = prune();
    if (removed > 0) {
        std::cout << "[STORE] Pruned " << removed << " old generation(s)" << std::endl;
    }
}

void GenerationStore::write_tables(const Generation& generation, const std::string& dir) const {
    {
        const auto& rows = generation.kpi_values();
        std::vector<std::string> entities, keys;
        std::vector<int64_t> periods;
        std::vector<double> values;
        std::vector<uint8_t> has_value;
        entities.reserve(rows.size());
        keys.reserve(rows.size());
        periods.reserve(rows.size());
        values.reserve(rows.size());
        has_value.reserve(rows.size());

        for (const auto& row : rows) {
            entities.push_back(row.entity_id);
            periods.push_back(row.period);
            keys.push_back(row.kpi_key);
            values.push_back(row.value.value_or(0.0));
            has_value.push_back(row.value ? 1 : 0);
        }

        pbt::TableWriter writer((fs::path(dir) / KPI_TABLE_FILE).string(),
                                pbt::TableKind::KPI_VALUES, generation.id(), compression_level_);
        writer.add_string_column("entity_id", entities);
        writer.add_int64_column("period", periods);
        writer.add_string_column("kpi_key", keys);
        writer.add_float64_column("value", values);
        writer.add_uint8_column("has_value", has_value);
        writer.finalize();
    }

    {
        const auto& rows = generation.benchmark_stats();
        std::vector<std::string> kpis, scopes, scope_keys;
        std::vector<int64_t> periods, counts;
        std::vector<double> p25, median, p75, mean;

        for (const auto& row : rows) {
            kpis.push_back(row.key.kpi_key);
            scopes.push_back(row.key.scope);
            scope_keys.push_back(row.key.scope_key);
            periods.push_back(row.key.period);
            p25.push_back(row.stat.p25);
            median.push_back(row.stat.median);
            p75.push_back(row.stat.p75);
            mean.push_back(row.stat.mean);
            counts.push_back(static_cast<int64_t>(row.stat.sample_count));
        }

        pbt::TableWriter writer((fs::path(dir) / BENCHMARK_TABLE_FILE).string(),
                                pbt::TableKind::BENCHMARK_STATS, generation.id(), compression_level_);
        writer.add_string_column("kpi_key", kpis);
        writer.add_string_column("scope", scopes);
        writer.add_string_column("scope_key", scope_keys);
        writer.add_int64_column("period", periods);
        writer.add_float64_column("p25", p25);
        writer.add_float64_column("median", median);
        writer.add_float64_column("p75", p75);
        writer.add_float64_column("mean", mean);
        writer.add_int64_column("sample_count", counts);
        writer.finalize();
    }
}

void GenerationStore::write_current_marker(const std::string& id) const {
    const fs::path marker = fs::path(root_) / CURRENT_MARKER;
    const fs::path temp = fs::path(root_) / (std::string(CURRENT_MARKER) + ".tmp");

    {
        std::ofstream out(temp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageUnavailable("cannot write " + temp.string());
        }
        out << id << "\n";
        out.flush();
        if (!out.good()) {
            throw StorageUnavailable("cannot write " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, marker, ec);
    if (ec) {
        throw StorageUnavailable("cannot replace " + marker.string() + ": " + ec.message());
    }
}

// ============================================================================
// Probe & Load
// ============================================================================

std::optional<std::string> GenerationStore::current_generation_id() const {
    std::ifstream in(fs::path(root_) / CURRENT_MARKER);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string id;
    std::getline(in, id);
    while (!id.empty() && (id.back() == '\r' || id.back() == ' ')) {
        id.pop_back();
    }
    if (id.empty()) {
        return std::nullopt;
    }
    return id;
}

StorageProbe GenerationStore::probe() const {
    StorageProbe result;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        result.detail = "store root not accessible: " + root_;
        return result;
    }
    result.reachable = true;

    result.generation_id = current_generation_id();
    if (!result.generation_id) {
        result.detail = "no published generation";
        return result;
    }

    const fs::path dir = generation_dir(*result.generation_id);

    try {
        check_table((dir / KPI_TABLE_FILE).string(), pbt::TableKind::KPI_VALUES, *result.generation_id);
        result.kpi_table_ready = true;
    } catch (const std::exception& e) {
        result.detail += std::string(e.what()) + "; ";
    }

    try {
        check_table((dir / BENCHMARK_TABLE_FILE).string(), pbt::TableKind::BENCHMARK_STATS,
                    *result.generation_id);
        result.benchmark_table_ready = true;
    } catch (const std::exception& e) {
        result.detail += std::string(e.what()) + "; ";
    }

    return result;
}

std::shared_ptr<const Generation> GenerationStore::load(const StorageProbe& probe) const {
    if (!probe.generation_id || !probe.any_table_ready()) {
        return nullptr;
    }

    const fs::path dir = generation_dir(*probe.generation_id);

    std::vector<KpiValueRecord> kpi_rows;
    if (probe.kpi_table_ready) {
        kpi_rows = read_kpi_table((dir / KPI_TABLE_FILE).string());
    }

    std::vector<BenchmarkRecord> benchmark_rows;
    if (probe.benchmark_table_ready) {
        benchmark_rows = read_benchmark_table((dir / BENCHMARK_TABLE_FILE).string());
    }

    std::cout << "[STORE] Loaded generation " << *probe.generation_id << " ("
              << kpi_rows.size() << " KPI rows, " << benchmark_rows.size()
              << " benchmark rows)" << std::endl;

    return std::make_shared<const Generation>(*probe.generation_id, std::move(kpi_rows),
                                              std::move(benchmark_rows),
                                              probe.kpi_table_ready, probe.benchmark_table_ready);
}

// ============================================================================
// Retention
// ============================================================================

std::vector<std::string> GenerationStore::list_generations() const {
    std::vector<std::pair<uint64_t, std::string>> found;

    std::error_code ec;
    fs::directory_iterator it(fs::path(root_) / GENERATIONS_DIR, ec);
    if (ec) {
        return {};
    }
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (auto sequence = parse_generation_id(name)) {
            found.emplace_back(*sequence, name);
        }
    }

    std::sort(found.begin(), found.end());
    std::vector<std::string> names;
    for (auto& [sequence, name] : found) {
        names.push_back(std::move(name));
    }
    return names;
}

size_t GenerationStore::prune() const {
    auto generations = list_generations();
    auto current = current_generation_id();

    size_t removed = 0;
    if (generations.size() <= generations_to_keep_) {
        return removed;
    }

    const size_t excess = generations.size() - generations_to_keep_;
    for (size_t i = 0; i < excess; ++i) {
        if (current && generations[i] == *current) {
            continue;
        }
        std::error_code ec;
        fs::remove_all(generation_dir(generations[i]), ec);
        if (ec) {
            std::cerr << "[STORE] Failed to prune " << generations[i] << ": " << ec.message() << std::endl;
            continue;
        }
        ++removed;
    }
    return removed;
}

} // namespace peerbench

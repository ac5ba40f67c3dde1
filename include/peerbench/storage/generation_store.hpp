#pragma once

/**
 * @file generation_store.hpp
 * @brief On-disk home of published generations
 *
 * Layout under the store root:
 * @code
 *   CURRENT                                  id of the published generation
 *   generations/<id>/kpi_values.pbt
 *   generations/<id>/benchmark_stats.pbt
 * @endcode
 *
 * Publishing writes the tables into a hidden temporary directory, renames it
 * to generations/<id>, then replaces CURRENT through write-temp-and-rename.
 * Readers therefore see either the previous generation or the complete new
 * one. Older generation directories are pruned after a successful publish.
 */

#include "peerbench/storage/generation.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerbench {

/// Result of inspecting the store without loading it
struct StorageProbe {
    bool reachable = false;                     ///< Store root is an accessible directory
    std::optional<std::string> generation_id;   ///< Content of CURRENT
    bool kpi_table_ready = false;               ///< kpi_values passed all checks
    bool benchmark_table_ready = false;         ///< benchmark_stats passed all checks
    std::string detail;                         ///< Reason a table is not ready

    bool any_table_ready() const { return kpi_table_ready || benchmark_table_ready; }
};

/// "gen-000042" for 42
std::string format_generation_id(uint64_t sequence);

/// Sequence number of a "gen-NNNNNN" id
std::optional<uint64_t> parse_generation_id(const std::string& id);

class GenerationStore {
public:
    static constexpr const char* CURRENT_MARKER = "CURRENT";
    static constexpr const char* GENERATIONS_DIR = "generations";
    static constexpr const char* KPI_TABLE_FILE = "kpi_values.pbt";
    static constexpr const char* BENCHMARK_TABLE_FILE = "benchmark_stats.pbt";

    explicit GenerationStore(std::string root,
                             int compression_level = constants::DEFAULT_COMPRESSION_LEVEL,
                             size_t generations_to_keep = constants::DEFAULT_GENERATIONS_TO_KEEP);

    const std::string& root() const { return root_; }

    /// Next unused id ("gen-000001", "gen-000002", ...)
    std::string next_generation_id() const;

    /**
     * @brief Persist a generation and make it current
     * @throws StorageUnavailable on any I/O failure (CURRENT is left untouched)
     */
    void publish(const Generation& generation);

    /// Inspect CURRENT and both tables. Never throws.
    StorageProbe probe() const;

    /**
     * @brief Load the tables the probe reported ready
     * @return nullptr when no table is ready
     * @throws StorageUnavailable or TableFormatError if a table fails to load
     */
    std::shared_ptr<const Generation> load(const StorageProbe& probe) const;

    /// Content of CURRENT, if any
    std::optional<std::string> current_generation_id() const;

    /// Generation directories on disk, oldest first
    std::vector<std::string> list_generations() const;

    /// Remove old generations beyond the retention count; returns how many
    size_t prune() const;

private:
    std::string generation_dir(const std::string& id) const;
    void write_tables(const Generation& generation, const std::string& dir) const;
    void write_current_marker(const std::string& id) const;

    std::string root_;
    int compression_level_;
    size_t generations_to_keep_;
};

} // namespace peerbench

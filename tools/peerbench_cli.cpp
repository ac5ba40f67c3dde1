/**
 * @file peerbench_cli.cpp
 * @brief Administrative command line for the peerbench engine
 *
 * Exit status: 0 success, 1 usage error, 2 configuration error,
 * 3 build (or data load) failure.
 */

#include "peerbench/config/config_loader.hpp"
#include "peerbench/core/engine_context.hpp"
#include "peerbench/core/errors.hpp"
#include "peerbench/core/version.hpp"
#include "peerbench/data/csv_loader.hpp"
#include "peerbench/pipeline/build_pipeline.hpp"
#include "peerbench/serving/query_router.hpp"
#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <string>

using namespace peerbench;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_CONFIG = 2;
constexpr int EXIT_BUILD = 3;

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void print_usage(const char* program) {
    std::cout << "peerbench " << Version::get_version_string() << "\n\n"
              << "Usage: " << program << " <command> [options]\n\n"
              << "Commands:\n"
              << "  build        Compute and publish a new generation\n"
              << "  kpis         --entity ID --period YEAR [--level N]\n"
              << "  benchmarks   --kpi KEY --scope ID --scope-key KEY --period YEAR\n"
              << "  compare      --entity ID --period YEAR --kpi KEY --scope ID\n"
              << "  probe        Show the access mode of each query kind\n\n"
              << "Configuration:\n"
              << "  --line-items FILE         entity_id,period,line,column,value\n"
              << "  --aggregates FILE         name,line,column\n"
              << "  --kpis FILE               key,level,parent_key,formula,unit,higher_is_better[,decimals][,label]\n"
              << "  --scopes FILE             scope_id,dimensions (default: all, by-region, ...)\n"
              << "  --entities FILE           entity_id,<dimension>...\n"
              << "  --no-ccn-dimensions       Do not derive region/category from provider numbers\n"
              << "  --store DIR               Generation store (default: in-memory only)\n"
              << "  --keep N                  Generations kept on disk (default: "
              << constants::DEFAULT_GENERATIONS_TO_KEEP << ")\n"
              << "  --compression-level N     ZSTD level (default: "
              << constants::DEFAULT_COMPRESSION_LEVEL << ")\n"
              << "  --cache-capacity N        Result cache entries (default: "
              << constants::DEFAULT_CACHE_CAPACITY << ")\n"
              << "  --cache-shards N          Result cache shards (default: "
              << constants::DEFAULT_CACHE_SHARDS << ")\n"
              << "  --cache-ttl-ms N          TTL of cached results\n"
              << "  --negative-ttl-ms N       TTL of cached absences\n"
              << "  --fallback-timeout-ms N   Bound on on-the-fly queries (0 = inline)\n"
              << "  --fallback-workers N      Worker threads for on-the-fly queries\n"
              << "  --reprobe-interval-ms N   Re-probe interval while degraded\n"
              << "  --help                    Show this message\n";
}

/// Flags taking a value; anything else starting with "--" is a switch
const std::set<std::string>& value_flags() {
    static const std::set<std::string> flags = {
        "--line-items", "--aggregates", "--kpis", "--scopes", "--entities", "--store",
        "--keep", "--compression-level", "--cache-capacity", "--cache-shards",
        "--cache-ttl-ms", "--negative-ttl-ms", "--fallback-timeout-ms",
        "--fallback-workers", "--reprobe-interval-ms",
        "--entity", "--period", "--level", "--kpi", "--scope", "--scope-key",
    };
    return flags;
}

std::map<std::string, std::string> parse_flags(int argc, char* argv[], int first) {
    std::map<std::string, std::string> flags;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-ccn-dimensions" || arg == "--help" || arg == "-h") {
            flags[arg] = "";
        } else if (value_flags().count(arg)) {
            if (i + 1 >= argc) {
                throw UsageError("Missing value for " + arg);
            }
            flags[arg] = argv[++i];
        } else {
            throw UsageError("Unknown option: " + arg);
        }
    }
    return flags;
}

int64_t int_flag(const std::map<std::string, std::string>& flags, const std::string& name,
                 int64_t fallback) {
    auto it = flags.find(name);
    if (it == flags.end()) {
        return fallback;
    }
    int64_t value = 0;
    if (!CsvLoader::try_parse_int64(it->second, value) || value < 0) {
        throw UsageError("Invalid value for " + name + ": " + it->second);
    }
    return value;
}

const std::string& required_flag(const std::map<std::string, std::string>& flags,
                                 const std::string& name) {
    auto it = flags.find(name);
    if (it == flags.end() || it->second.empty()) {
        throw UsageError("Missing required option " + name);
    }
    return it->second;
}

std::string optional_flag(const std::map<std::string, std::string>& flags, const std::string& name) {
    auto it = flags.find(name);
    return it == flags.end() ? std::string() : it->second;
}

EngineOptions options_from_flags(const std::map<std::string, std::string>& flags) {
    EngineOptions options;
    options.line_items_path = optional_flag(flags, "--line-items");
    options.aggregates_path = required_flag(flags, "--aggregates");
    options.kpis_path = required_flag(flags, "--kpis");
    options.scopes_path = optional_flag(flags, "--scopes");
    options.entities_path = optional_flag(flags, "--entities");
    options.derive_ccn_dimensions = flags.count("--no-ccn-dimensions") == 0;
    options.store_root = optional_flag(flags, "--store");

    options.generations_to_keep = static_cast<size_t>(
        int_flag(flags, "--keep", static_cast<int64_t>(options.generations_to_keep)));
    options.compression_level = static_cast<int>(
        int_flag(flags, "--compression-level", options.compression_level));
    options.cache_capacity = static_cast<size_t>(
        int_flag(flags, "--cache-capacity", static_cast<int64_t>(options.cache_capacity)));
    options.cache_shards = static_cast<size_t>(
        int_flag(flags, "--cache-shards", static_cast<int64_t>(options.cache_shards)));
    options.cache_ttl_ms = int_flag(flags, "--cache-ttl-ms", options.cache_ttl_ms);
    options.negative_ttl_ms = int_flag(flags, "--negative-ttl-ms", options.negative_ttl_ms);
    options.fallback_timeout_ms = int_flag(flags, "--fallback-timeout-ms", options.fallback_timeout_ms);
    options.fallback_workers = static_cast<size_t>(
        int_flag(flags, "--fallback-workers", static_cast<int64_t>(options.fallback_workers)));
    options.reprobe_interval_ms = int_flag(flags, "--reprobe-interval-ms", options.reprobe_interval_ms);
    return options;
}

Period period_flag(const std::map<std::string, std::string>& flags) {
    const std::string& text = required_flag(flags, "--period");
    int64_t value = 0;
    if (!CsvLoader::try_parse_int64(text, value)) {
        throw UsageError("Invalid period: " + text);
    }
    return static_cast<Period>(value);
}

std::string format_value(const KpiValue& value) {
    if (!value) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(12) << *value;
    return out.str();
}

void print_stat(const BenchmarkStat& stat) {
    std::cout << std::setprecision(12)
              << "  p25:          " << stat.p25 << "\n"
              << "  median:       " << stat.median << "\n"
              << "  p75:          " << stat.p75 << "\n"
              << "  mean:         " << stat.mean << "\n"
              << "  sample_count: " << stat.sample_count << "\n";
}

// ============================================================================
// Commands
// ============================================================================

int run_build(EngineContext& context) {
    BuildPipeline pipeline(context);
    BuildReport report = pipeline.run();

    std::cout << "\nGeneration:      " << report.generation_id
              << (report.persisted ? "" : " (in-memory)") << "\n"
              << "Entity/periods:  " << report.entity_period_count << "\n"
              << "KPI rows:        " << report.kpi_rows << " (" << report.non_null_kpi_rows
              << " non-null)\n"
              << "Benchmark rows:  " << report.benchmark_rows << "\n";
    for (const char* stage : {stages::LOAD, stages::COMPUTE_KPIS, stages::COMPUTE_BENCHMARKS,
                              stages::BUILD_INDEXES, stages::PUBLISH}) {
        std::cout << "  " << std::left << std::setw(20) << stage << std::right << std::fixed
                  << std::setprecision(1) << report.stage_ms[stage] << " ms\n";
    }
    std::cout << "Elapsed:         " << std::fixed << std::setprecision(1)
              << report.elapsed_ms << " ms" << std::endl;
    return EXIT_OK;
}

int run_kpis(EngineContext& context, const std::map<std::string, std::string>& flags) {
    const std::string& entity = required_flag(flags, "--entity");
    const Period period = period_flag(flags);

    QueryRouter router(context);
    KpiResponse response = flags.count("--level")
        ? router.get_kpis_for_level(entity, period, static_cast<int>(int_flag(flags, "--level", 1)))
        : router.get_kpis(entity, period);

    std::cout << "Entity " << entity << ", period " << period
              << " [" << to_string(response.provenance) << "]\n";
    if (!response.available()) {
        std::cout << "  no data available\n";
        return EXIT_OK;
    }
    if (response.values.empty()) {
        std::cout << "  entity/period not found\n";
    }
    for (const auto& key : context.registry().keys()) {
        auto it = response.values.find(key);
        if (it == response.values.end()) {
            continue;
        }
        const KpiDefinition& def = context.registry().get(key);
        std::cout << "  " << std::string(static_cast<size_t>(def.level - 1) * 2, ' ')
                  << std::left << std::setw(32) << key << std::right << " "
                  << format_value(it->second) << (def.unit.empty() ? "" : " " + def.unit) << "\n";
    }
    return EXIT_OK;
}

int run_benchmarks(EngineContext& context, const std::map<std::string, std::string>& flags) {
    const std::string& kpi = required_flag(flags, "--kpi");
    const std::string& scope = required_flag(flags, "--scope");
    const std::string& scope_key = required_flag(flags, "--scope-key");
    const Period period = period_flag(flags);

    QueryRouter router(context);
    BenchmarkResponse response = router.get_benchmarks(kpi, scope, scope_key, period);

    std::cout << kpi << " / " << scope << " = " << scope_key << ", period " << period
              << " [" << to_string(response.provenance) << "]\n";
    if (!response.available()) {
        std::cout << "  no data available\n";
    } else if (!response.stat) {
        std::cout << "  no peer values in this group\n";
    } else {
        print_stat(*response.stat);
    }
    return EXIT_OK;
}

int run_compare(EngineContext& context, const std::map<std::string, std::string>& flags) {
    const std::string& entity = required_flag(flags, "--entity");
    const std::string& kpi = required_flag(flags, "--kpi");
    const std::string& scope = required_flag(flags, "--scope");
    const Period period = period_flag(flags);

    QueryRouter router(context);
    PeerComparison result = router.compare_to_peers(entity, period, kpi, scope);

    std::cout << entity << " " << kpi << " (" << period << ") vs " << scope;
    if (result.scope_key) {
        std::cout << " = " << *result.scope_key;
    }
    std::cout << "\n  value:        " << format_value(result.value)
              << " [" << to_string(result.kpi_provenance) << "]\n";
    if (!result.scope_key) {
        std::cout << "  entity is not part of this scope\n";
        return EXIT_OK;
    }
    if (!result.stat) {
        std::cout << "  no benchmark [" << to_string(result.benchmark_provenance) << "]\n";
        return EXIT_OK;
    }
    print_stat(*result.stat);
    if (result.band) {
        std::cout << "  position:     " << to_string(*result.band) << "\n"
                  << "  gap:          " << *result.gap << "\n"
                  << "  status:       " << (result.underperforming ? "underperforming" : "on par or better")
                  << "\n";
    }
    return EXIT_OK;
}

int run_probe(EngineContext& context) {
    CapabilityModes modes = context.refresh("probe");
    std::cout << "kpi_values:  " << to_string(modes.kpi_values) << "\n"
              << "benchmarks:  " << to_string(modes.benchmarks) << "\n";
    if (auto generation = context.current_generation()) {
        std::cout << "generation:  " << generation->id() << " ("
                  << generation->kpi_row_count() << " KPI rows, "
                  << generation->benchmark_row_count() << " benchmark rows)\n";
    } else {
        std::cout << "generation:  none\n";
    }
    if (auto source = context.source()) {
        std::cout << "line items:  " << source->get_total_items() << " from "
                  << source->get_source_path() << "\n";
    }
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    const std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return EXIT_OK;
    }
    if (command == "--version") {
        std::cout << "peerbench " << Version::get_version_string() << std::endl;
        return EXIT_OK;
    }

    try {
        auto flags = parse_flags(argc, argv, 2);
        if (flags.count("--help") || flags.count("-h")) {
            print_usage(argv[0]);
            return EXIT_OK;
        }

        EngineOptions options = options_from_flags(flags);
        if (command == "build" && options.line_items_path.empty()) {
            throw UsageError("build requires --line-items");
        }
        if (command != "build" && command != "kpis" && command != "benchmarks" &&
            command != "compare" && command != "probe") {
            throw UsageError("Unknown command: " + command);
        }

        auto context = load_engine_context(options);

        if (command == "build") return run_build(*context);
        if (command == "kpis") return run_kpis(*context, flags);
        if (command == "benchmarks") return run_benchmarks(*context, flags);
        if (command == "compare") return run_compare(*context, flags);
        return run_probe(*context);

    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    } catch (const ConfigurationError& e) {
        std::cerr << "[CONFIG] " << e.what() << std::endl;
        return EXIT_CONFIG;
    } catch (const BuildFailure& e) {
        std::cerr << "[BUILD] " << e.what() << std::endl;
        std::cerr << "[BUILD] stage:   " << e.stage() << "\n"
                  << "[BUILD] subject: " << e.subject() << std::endl;
        return EXIT_BUILD;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::runtime_error& e) {
        // Line items that cannot be read fail the load stage
        std::cerr << "[BUILD] Build failed in stage '" << stages::LOAD << "': " << e.what() << std::endl;
        return EXIT_BUILD;
    }
}

#include "peerbench/serving/query_router.hpp"
#include "peerbench/core/errors.hpp"
#include <future>
#include <iostream>
#include <stdexcept>

namespace peerbench {

QueryRouter::QueryRouter(EngineContext& context)
    : context_(context)
    , calculator_(context.registry())
    , aggregator_(context.directory())
{
    if (context_.options().fallback_timeout_ms > 0) {
        executor_ = std::make_unique<FallbackExecutor>(context_.options().fallback_workers);
    }
}

// ============================================================================
// Cache Keys
// ============================================================================

std::string QueryRouter::kpi_cache_key(const EntityId& entity_id, Period period) {
    return "kpis|" + entity_id + "|" + std::to_string(period);
}

std::string QueryRouter::benchmark_cache_key(const KpiKey& kpi_key, const std::string& scope,
                                             const std::string& scope_key, Period period) {
    return "bench|" + kpi_key + "|" + scope + "|" + scope_key + "|" + std::to_string(period);
}

std::chrono::milliseconds QueryRouter::ttl_for(bool has_data) const {
    const auto& options = context_.options();
    return std::chrono::milliseconds(has_data ? options.cache_ttl_ms : options.negative_ttl_ms);
}

// ============================================================================
// RawFallback
// ============================================================================

template <typename Result, typename F>
std::optional<Result> QueryRouter::run_fallback(QueryKind kind, const std::string& what, F&& compute) {
    auto token = std::make_shared<CancellationToken>();

    try {
        if (!executor_) {
            return std::optional<Result>(std::in_place, compute(token.get()));
        }

        // The task owns copies of everything it reads; it may outlive this call
        auto future = executor_->submit([token, compute]() { return compute(token.get()); });

        const auto timeout = std::chrono::milliseconds(context_.options().fallback_timeout_ms);
        if (future.wait_for(timeout) != std::future_status::ready) {
            token->cancel();
            std::cerr << "[ROUTER] " << what << " timed out after "
                      << timeout.count() << " ms" << std::endl;
            return std::nullopt;
        }
        return std::optional<Result>(std::in_place, future.get());
    } catch (const OperationCancelled& e) {
        std::cerr << "[ROUTER] " << what << ": " << e.what() << std::endl;
        return std::nullopt;
    } catch (const StorageUnavailable& e) {
        context_.report_io_failure(kind, e.what());
        return std::nullopt;
    }
}

std::vector<EntityKpiValue> QueryRouter::compute_peer_values(const ILineItemSource& source,
                                                             const KpiDefinition& def,
                                                             const BenchmarkScope& scope,
                                                             const std::string& scope_key,
                                                             Period period,
                                                             const CancellationToken* token) const {
    std::vector<EntityKpiValue> values;
    for (const auto& entity_id : source.get_entities(period)) {
        check_cancelled(token, "peer value computation");

        auto key = scope.scope_key_for(entity_id, context_.directory());
        if (!key || *key != scope_key) {
            continue;
        }
        LineItemSlice slice = source.read_entity_period(entity_id, period);
        values.push_back(EntityKpiValue{entity_id, calculator_.compute(def, slice, token).as_value()});
    }
    return values;
}

// ============================================================================
// KPI Queries
// ============================================================================

KpiResponse QueryRouter::get_kpis(const EntityId& entity_id, Period period) {
    const std::string key = kpi_cache_key(entity_id, period);

    if (auto cached = context_.cache().get(key)) {
        if (const auto* response = std::get_if<KpiResponse>(&*cached)) {
            return *response;
        }
    }

    // Read before the fetch: an answer that straddles a publish is not cached
    const uint64_t epoch = context_.cache().epoch();
    KpiResponse response = fetch_kpis(entity_id, period);
    context_.cache().put(key, response, ttl_for(response.has_values()), epoch);
    return response;
}

KpiResponse QueryRouter::fetch_kpis(const EntityId& entity_id, Period period) {
    KpiResponse response;

    switch (context_.mode(QueryKind::KpiValues)) {
    case AccessMode::Precomputed: {
        auto generation = context_.current_generation();
        if (!generation || !generation->has_kpi_table()) {
            context_.report_io_failure(QueryKind::KpiValues, "no installed kpi_values table");
            break;
        }
        response.values = generation->find_kpis(entity_id, period);
        response.provenance = Provenance::Precomputed;
        break;
    }

    case AccessMode::RawFallback: {
        auto source = context_.source();
        if (!source) {
            break;
        }
        auto values = run_fallback<std::map<KpiKey, KpiValue>>(
            QueryKind::KpiValues,
            "kpis " + entity_id + "/" + std::to_string(period),
            [this, source, entity_id, period](const CancellationToken* token) {
                LineItemSlice slice = source->read_entity_period(entity_id, period);
                if (slice.empty()) {
                    return std::map<KpiKey, KpiValue>();
                }
                return calculator_.compute_values(slice, token);
            });
        if (values) {
            response.values = std::move(*values);
            response.provenance = Provenance::RawFallback;
        }
        break;
    }

    case AccessMode::Unavailable:
        break;
    }

    return response;
}

KpiResponse QueryRouter::get_kpis_for_level(const EntityId& entity_id, Period period, int level) {
    if (level < 1 || level > 3) {
        throw std::invalid_argument("KPI level must be 1, 2 or 3, got " + std::to_string(level));
    }

    KpiResponse response = get_kpis(entity_id, period);
    for (auto it = response.values.begin(); it != response.values.end();) {
        const KpiDefinition* def = context_.registry().find(it->first);
        if (!def || def->level != level) {
            it = response.values.erase(it);
        } else {
            ++it;
        }
    }
    return response;
}

// ============================================================================
// Benchmark Queries
// ============================================================================

BenchmarkResponse QueryRouter::get_benchmarks(const KpiKey& kpi_key, const std::string& scope,
                                              const std::string& scope_key, Period period) {
    const KpiDefinition* def = context_.registry().find(kpi_key);
    if (!def) {
        throw std::invalid_argument("Unknown KPI: " + kpi_key);
    }
    const BenchmarkScope* scope_def = context_.scopes().find(scope);
    if (!scope_def) {
        throw std::invalid_argument("Unknown scope: " + scope);
    }

    const std::string key = benchmark_cache_key(kpi_key, scope, scope_key, period);

    if (auto cached = context_.cache().get(key)) {
        if (const auto* response = std::get_if<BenchmarkResponse>(&*cached)) {
            return *response;
        }
    }

    const uint64_t epoch = context_.cache().epoch();
    BenchmarkResponse response = fetch_benchmark(*def, *scope_def, scope_key, period);
    context_.cache().put(key, response, ttl_for(response.stat.has_value()), epoch);
    return response;
}

BenchmarkResponse QueryRouter::fetch_benchmark(const KpiDefinition& def, const BenchmarkScope& scope,
                                               const std::string& scope_key, Period period) {
    BenchmarkResponse response;

    switch (context_.mode(QueryKind::Benchmarks)) {
    case AccessMode::Precomputed: {
        auto generation = context_.current_generation();
        if (!generation || !generation->has_benchmark_table()) {
            context_.report_io_failure(QueryKind::Benchmarks, "no installed benchmark_stats table");
            break;
        }
        response.stat = generation->find_benchmark(BenchmarkKey(def.key, scope.id, scope_key, period));
        response.provenance = Provenance::Precomputed;
        break;
    }

    case AccessMode::RawFallback: {
        auto source = context_.source();
        if (!source) {
            break;
        }
        const KpiDefinition* def_ptr = &def;
        const BenchmarkScope* scope_ptr = &scope;
        auto stat = run_fallback<std::optional<BenchmarkStat>>(
            QueryKind::Benchmarks,
            "benchmark " + def.key + "/" + scope.id + "/" + scope_key + "/" + std::to_string(period),
            [this, source, def_ptr, scope_ptr, scope_key, period](const CancellationToken* token) {
                auto values = compute_peer_values(*source, *def_ptr, *scope_ptr, scope_key, period, token);
                return aggregator_.aggregate_group(*scope_ptr, scope_key, values, token);
            });
        if (stat) {
            response.stat = std::move(*stat);
            response.provenance = Provenance::RawFallback;
        }
        break;
    }

    case AccessMode::Unavailable:
        break;
    }

    return response;
}

// ============================================================================
// Peer Comparison
// ============================================================================

PeerComparison QueryRouter::compare_to_peers(const EntityId& entity_id, Period period,
                                             const KpiKey& kpi_key, const std::string& scope) {
    const KpiDefinition* def = context_.registry().find(kpi_key);
    if (!def) {
        throw std::invalid_argument("Unknown KPI: " + kpi_key);
    }
    const BenchmarkScope* scope_def = context_.scopes().find(scope);
    if (!scope_def) {
        throw std::invalid_argument("Unknown scope: " + scope);
    }

    PeerComparison result;
    result.entity_id = entity_id;
    result.period = period;
    result.kpi_key = kpi_key;
    result.scope = scope;
    result.scope_key = scope_def->scope_key_for(entity_id, context_.directory());

    KpiResponse kpis = get_kpis(entity_id, period);
    result.kpi_provenance = kpis.provenance;
    auto it = kpis.values.find(kpi_key);
    if (it != kpis.values.end()) {
        result.value = it->second;
    }

    if (!result.scope_key) {
        return result;
    }

    BenchmarkResponse bench = get_benchmarks(kpi_key, scope, *result.scope_key, period);
    result.benchmark_provenance = bench.provenance;
    result.stat = bench.stat;

    if (result.value && result.stat) {
        result.band = classify_quartile(*result.value, *result.stat);
        result.gap = performance_gap(*result.value, *result.stat, def->higher_is_better);
        result.underperforming = *result.gap > 0.0;
    }
    return result;
}

std::vector<EntityId> QueryRouter::list_entities(Period period) {
    switch (context_.mode(QueryKind::KpiValues)) {
    case AccessMode::Precomputed: {
        auto generation = context_.current_generation();
        if (generation) {
            return generation->entities(period);
        }
        break;
    }

    case AccessMode::RawFallback: {
        auto source = context_.source();
        if (!source) {
            break;
        }
        try {
            return source->get_entities(period);
        } catch (const StorageUnavailable& e) {
            context_.report_io_failure(QueryKind::KpiValues, e.what());
        }
        break;
    }

    case AccessMode::Unavailable:
        break;
    }
    return {};
}

} // namespace peerbench

/**
 * @file test_kpi_calculator.cpp
 * @brief Tests for KPI computation from line-item slices
 */

#include "peerbench/core/cancellation.hpp"
#include "peerbench/processing/kpi_calculator.hpp"
#include "test_fixtures.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace peerbench;
using namespace peerbench::testing;

void test_current_ratio() {
    std::cout << "Testing current ratio... ";

    LineItemStore::Builder builder;
    builder.add("310001", 2024, "CA", "TOTAL", 3.0e9);
    builder.add("310001", 2024, "CL", "TOTAL", 5.21e8);
    auto store = builder.build();

    KpiRegistry registry = sample_registry();
    KpiCalculator calculator(registry);

    KpiResult result = calculator.compute(registry.get("current_ratio"),
                                          store->read_entity_period("310001", 2024));
    assert(result.ok());
    assert(result.value == 5.76);

    std::cout << "PASSED\n";
}

void test_zero_denominator_is_null() {
    std::cout << "Testing zero denominator... ";

    auto store = sample_store();
    KpiRegistry registry = sample_registry();
    KpiCalculator calculator(registry);

    KpiResult result = calculator.compute(registry.get("current_ratio"),
                                          store->read_entity_period("311300", 2024));
    assert(!result.ok());
    assert(result.status == KpiStatus::ZeroDenominator);
    assert(!result.as_value().has_value());

    std::cout << "PASSED\n";
}

void test_missing_aggregate_is_null() {
    std::cout << "Testing missing aggregate... ";

    LineItemStore::Builder builder;
    builder.add("310001", 2024, "CA", "TOTAL", 100.0);
    auto store = builder.build();

    KpiRegistry registry = sample_registry();
    KpiCalculator calculator(registry);

    KpiResult result = calculator.compute(registry.get("current_ratio"),
                                          store->read_entity_period("310001", 2024));
    assert(result.status == KpiStatus::InsufficientData);

    // An empty slice never yields zero
    result = calculator.compute(registry.get("current_ratio"), LineItemSlice());
    assert(result.status == KpiStatus::InsufficientData);

    std::cout << "PASSED\n";
}

void test_unmapped_kpi() {
    std::cout << "Testing unmapped KPI... ";

    auto store = sample_store();
    KpiRegistry registry = sample_registry();
    KpiCalculator calculator(registry);

    KpiResult result = calculator.compute(registry.get("medicare_ccr"),
                                          store->read_entity_period("310001", 2024));
    assert(result.status == KpiStatus::Unmapped);
    assert(!result.as_value());

    std::cout << "PASSED\n";
}

void test_wildcard_aggregate() {
    std::cout << "Testing wildcard aggregate... ";

    auto store = sample_store();
    KpiRegistry registry = sample_registry();
    KpiCalculator calculator(registry);

    LineItemSlice slice = store->read_entity_period("310001", 2024);
    AggregateValues values = calculator.resolve_aggregates(slice, {"operating_expenses", "salary_expense"});
    assert(values["operating_expenses"].count == 2);
    assert(values["operating_expenses"].sum == 2040.0);
    assert(values["salary_expense"].count == 1);

    // 1100 / 2040 * 100 = 53.921...
    KpiResult result = calculator.compute(registry.get("salary_pct_of_expenses"), slice);
    assert(result.ok());
    assert(approx(result.value, 53.92));

    std::cout << "PASSED\n";
}

void test_compute_all_matches_compute() {
    std::cout << "Testing compute_all against compute... ";

    auto store = sample_store();
    KpiRegistry registry = sample_registry();
    KpiCalculator calculator(registry);

    for (Period period : store->get_periods()) {
        for (const auto& entity : store->get_entities(period)) {
            LineItemSlice slice = store->read_entity_period(entity, period);
            auto all = calculator.compute_all(slice);
            assert(all.size() == registry.size());

            for (size_t i = 0; i < all.size(); ++i) {
                KpiResult single = calculator.compute(registry.definitions()[i], slice);
                assert(single.status == all[i].status);
                assert(single.as_value() == all[i].as_value());
            }
        }
    }

    auto values = calculator.compute_values(store->read_entity_period("050003", 2024));
    assert(values.size() == registry.size());
    assert(values.at("current_ratio") == KpiValue(2.15));
    assert(!values.at("medicare_ccr"));

    std::cout << "PASSED\n";
}

void test_finalize() {
    std::cout << "Testing rounding and non-finite results... ";

    KpiDefinition def = make_kpi("k", 1, std::nullopt, "a", true, 1);
    assert(KpiCalculator::finalize(def, KpiResult::of(2.25)).value == 2.3);
    assert(KpiCalculator::finalize(def, KpiResult::of(-0.04)).value == -0.0);

    def.decimals = std::nullopt;
    assert(KpiCalculator::finalize(def, KpiResult::of(1.23456)).value == 1.23456);

    KpiResult inf = KpiCalculator::finalize(def, KpiResult::of(std::numeric_limits<double>::infinity()));
    assert(!inf.ok());

    std::cout << "PASSED\n";
}

void test_cancellation() {
    std::cout << "Testing cancellation checkpoint... ";

    auto store = sample_store();
    KpiRegistry registry = sample_registry();
    KpiCalculator calculator(registry);

    CancellationToken token;
    token.cancel();

    bool threw = false;
    try {
        calculator.compute_all(store->read_entity_period("310001", 2024), &token);
    } catch (const OperationCancelled&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== KPI Calculator Test Suite ===\n\n";

    try {
        test_current_ratio();
        test_zero_denominator_is_null();
        test_missing_aggregate_is_null();
        test_unmapped_kpi();
        test_wildcard_aggregate();
        test_compute_all_matches_compute();
        test_finalize();
        test_cancellation();

        std::cout << "\n=== All tests PASSED ===\n\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}

/**
 * @file test_kpi_registry.cpp
 * @brief Tests for formula parsing, KPI registry validation and the config loaders
 */

#include "peerbench/config/config_loader.hpp"
#include "peerbench/config/kpi_registry.hpp"
#include "peerbench/config/scope_registry.hpp"
#include "peerbench/core/errors.hpp"
#include "peerbench/processing/formula.hpp"
#include "test_fixtures.hpp"

#include <cassert>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>

using namespace peerbench;
using namespace peerbench::testing;

namespace {

bool throws_configuration_error(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

AggregateValues values_of(std::initializer_list<std::pair<const char*, double>> items) {
    AggregateValues values;
    for (const auto& [name, sum] : items) {
        values[name] = AggregateValue{sum, 1};
    }
    return values;
}

} // namespace

// ============================================================================
// Formulas
// ============================================================================

void test_formula_precedence() {
    std::cout << "Testing formula precedence... ";

    auto f = expr::parse_formula("a + b * 2 - c / 4");
    KpiResult r = f->evaluate(values_of({{"a", 1.0}, {"b", 3.0}, {"c", 8.0}}));
    assert(r.ok());
    assert(approx(r.value, 5.0));

    auto g = expr::parse_formula("-(a - b) * abs(c)");
    r = g->evaluate(values_of({{"a", 1.0}, {"b", 3.0}, {"c", -2.0}}));
    assert(r.ok());
    assert(approx(r.value, 4.0));

    auto deps = expr::parse_formula("x / (x + y.total)")->get_dependencies();
    assert(deps.size() == 2);
    assert(deps[0] == "x");
    assert(deps[1] == "y.total");

    std::cout << "PASSED\n";
}

void test_formula_null_outcomes() {
    std::cout << "Testing formula null outcomes... ";

    auto f = expr::parse_formula("a / b");

    KpiResult zero = f->evaluate(values_of({{"a", 1.0}, {"b", 0.0}}));
    assert(!zero.ok());
    assert(zero.status == KpiStatus::ZeroDenominator);
    assert(!zero.as_value());

    KpiResult missing = f->evaluate(values_of({{"a", 1.0}}));
    assert(missing.status == KpiStatus::InsufficientData);

    // An aggregate with no matching rows is missing, not zero
    AggregateValues unreported = values_of({{"a", 1.0}});
    unreported["b"] = AggregateValue{0.0, 0};
    assert(f->evaluate(unreported).status == KpiStatus::InsufficientData);

    std::cout << "PASSED\n";
}

void test_formula_syntax_errors() {
    std::cout << "Testing formula syntax errors... ";

    for (const char* text : {"a +", "(a / b", "a b", "", "sqrt(a)", "a / / b"}) {
        bool threw = false;
        try {
            expr::parse_formula(text);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "PASSED\n";
}

void test_pattern_matching() {
    std::cout << "Testing line-item patterns... ";

    assert(LineItemPredicate::pattern_matches("*", "anything"));
    assert(LineItemPredicate::pattern_matches("G3_*", "G3_LINE1"));
    assert(!LineItemPredicate::pattern_matches("G3_*", "G4_LINE1"));
    assert(LineItemPredicate::pattern_matches("TOTAL", "TOTAL"));
    assert(!LineItemPredicate::pattern_matches("TOTAL", "TOTAL2"));

    AggregateDefinition donations;
    donations.name = "donations";
    donations.predicates = {LineItemPredicate("NOI", "DONATION"), LineItemPredicate("NOI", "GRANT")};
    assert(donations.matches("NOI", "GRANT"));
    assert(!donations.matches("NOI", "INVEST"));

    std::cout << "PASSED\n";
}

// ============================================================================
// Registry
// ============================================================================

void test_registry_navigation() {
    std::cout << "Testing KPI tree navigation... ";

    KpiRegistry registry = sample_registry();
    assert(registry.size() == 5);

    auto roots = registry.roots();
    assert(roots.size() == 3);

    auto children = registry.children("net_income_margin");
    assert(children.size() == 1);
    assert(children[0] == "operating_expense_ratio");

    auto lineage = registry.lineage("salary_pct_of_expenses");
    assert(lineage.size() == 3);
    assert(lineage[0] == "net_income_margin");
    assert(lineage[2] == "salary_pct_of_expenses");

    auto below = registry.descendants("net_income_margin");
    assert(below.size() == 2);

    assert(registry.parent("operating_expense_ratio") == std::optional<KpiKey>("net_income_margin"));
    assert(!registry.parent("current_ratio"));
    assert(registry.by_level(3).size() == 1);

    assert(registry.find("medicare_ccr")->is_unmapped());
    assert(registry.find("unknown") == nullptr);

    bool threw = false;
    try {
        registry.get("unknown");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    // UNMAPPED KPIs contribute no aggregates
    auto required = registry.required_aggregates();
    assert(required.size() == 6);

    std::cout << "PASSED\n";
}

void test_registry_validation() {
    std::cout << "Testing KPI registry validation... ";

    auto with_kpis = [](std::vector<KpiDefinition> kpis) {
        return [kpis]() { KpiRegistry(sample_aggregates(), kpis); };
    };

    // Duplicate key
    assert(throws_configuration_error(with_kpis({
        make_kpi("a", 1, std::nullopt, "net_income"),
        make_kpi("a", 1, std::nullopt, "total_revenue"),
    })));

    // Level out of range
    assert(throws_configuration_error(with_kpis({
        make_kpi("a", 4, std::nullopt, "net_income"),
    })));

    // Level-1 with a parent
    assert(throws_configuration_error(with_kpis({
        make_kpi("a", 1, std::nullopt, "net_income"),
        make_kpi("b", 1, std::string("a"), "net_income"),
    })));

    // Level-2 without a parent
    assert(throws_configuration_error(with_kpis({
        make_kpi("a", 2, std::nullopt, "net_income"),
    })));

    // Dangling parent
    assert(throws_configuration_error(with_kpis({
        make_kpi("a", 2, std::string("missing"), "net_income"),
    })));

    // Parent two levels up
    assert(throws_configuration_error(with_kpis({
        make_kpi("a", 1, std::nullopt, "net_income"),
        make_kpi("b", 3, std::string("a"), "net_income"),
    })));

    // Cycle
    assert(throws_configuration_error(with_kpis({
        make_kpi("a", 2, std::string("b"), "net_income"),
        make_kpi("b", 2, std::string("a"), "net_income"),
    })));

    // Undefined aggregate and syntax error
    assert(throws_configuration_error(with_kpis({
        make_kpi("a", 1, std::nullopt, "net_income / no_such_aggregate"),
    })));
    assert(throws_configuration_error(with_kpis({
        make_kpi("a", 1, std::nullopt, "net_income /"),
    })));

    // Duplicate aggregate names
    assert(throws_configuration_error([]() {
        auto aggregates = sample_aggregates();
        aggregates.push_back(aggregates[0]);
        KpiRegistry(aggregates, sample_kpis());
    }));

    std::cout << "PASSED\n";
}

void test_scope_registry() {
    std::cout << "Testing scope registry... ";

    ScopeRegistry scopes = ScopeRegistry::defaults();
    assert(scopes.size() == 4);
    assert(scopes.find("by-region") != nullptr);
    assert(scopes.find("by-size") == nullptr);

    EntityDirectory directory;
    directory.derive_from_provider_numbers({"311300"});

    assert(scopes.find("all")->scope_key_for("anything", directory) ==
           std::optional<std::string>("ALL"));
    assert(scopes.find("by-region-and-category")->scope_key_for("311300", directory) ==
           std::optional<std::string>("31|Critical Access"));
    assert(!scopes.find("by-region")->scope_key_for("HOSP-1", directory));

    assert(throws_configuration_error([]() {
        ScopeRegistry({BenchmarkScope("x", {}), BenchmarkScope("x", {"region"})});
    }));
    assert(throws_configuration_error([]() {
        ScopeRegistry({BenchmarkScope("x", {"region", "region"})});
    }));

    std::cout << "PASSED\n";
}

// ============================================================================
// Config Loaders
// ============================================================================

void test_config_files() {
    std::cout << "Testing configuration files... ";

    TempDir dir("pb-config");
    const std::string aggregates = dir.file("aggregates.csv");
    const std::string kpis = dir.file("kpis.csv");
    const std::string scopes = dir.file("scopes.csv");
    {
        std::ofstream out(aggregates);
        out << "name,line,column\n"
            << "current_assets,CA,TOTAL\n"
            << "current_liabilities,CL,TOTAL\n"
            << "donations,NOI,DONATION\n"
            << "donations,NOI,GRANT\n";
    }
    {
        std::ofstream out(kpis);
        out << "key,level,parent_key,formula,unit,higher_is_better,decimals,label\n"
            << "current_ratio,1,,current_assets / current_liabilities,x,yes,2,Current Ratio\n"
            << "gifts,2,current_ratio,donations,$,true,,\n"
            << "ccr,1,,UNMAPPED,ratio,false,,\n";
    }
    {
        std::ofstream out(scopes);
        out << "scope_id,dimensions\n"
            << "all,\n"
            << "regional,region + category\n";
    }

    auto loaded_aggregates = load_aggregates_csv(aggregates);
    assert(loaded_aggregates.size() == 3);
    assert(loaded_aggregates[2].name == "donations");
    assert(loaded_aggregates[2].predicates.size() == 2);

    KpiRegistry registry = load_kpi_registry(aggregates, kpis);
    assert(registry.size() == 3);
    const KpiDefinition& ratio = registry.get("current_ratio");
    assert(ratio.higher_is_better);
    assert(ratio.decimals == std::optional<int>(2));
    assert(ratio.label == "Current Ratio");
    assert(registry.get("gifts").label == "gifts");
    assert(!registry.get("gifts").decimals);

    auto loaded_scopes = load_scopes_csv(scopes);
    assert(loaded_scopes.size() == 2);
    assert(loaded_scopes[0].dimensions.empty());
    assert(loaded_scopes[1].dimensions.size() == 2);
    assert(loaded_scopes[1].dimensions[1] == "category");

    std::cout << "PASSED\n";
}

void test_config_file_errors() {
    std::cout << "Testing configuration file errors... ";

    TempDir dir("pb-config");
    const std::string aggregates = dir.file("aggregates.csv");
    {
        std::ofstream out(aggregates);
        out << "name,line,column\n"
            << "current_assets,CA,TOTAL\n";
    }

    const std::string bad_bool = dir.file("bad_bool.csv");
    {
        std::ofstream out(bad_bool);
        out << "key,level,parent_key,formula,unit,higher_is_better\n"
            << "assets,1,,current_assets,$,maybe\n";
    }
    assert(throws_configuration_error([&]() { load_kpi_registry(aggregates, bad_bool); }));

    const std::string missing_column = dir.file("missing_column.csv");
    {
        std::ofstream out(missing_column);
        out << "key,level,formula,unit,higher_is_better\n"
            << "assets,1,current_assets,$,true\n";
    }
    assert(throws_configuration_error([&]() { load_kpi_registry(aggregates, missing_column); }));

    // 2^32 + 1 would wrap to a valid level 1 if narrowed
    const std::string huge_level = dir.file("huge_level.csv");
    {
        std::ofstream out(huge_level);
        out << "key,level,parent_key,formula,unit,higher_is_better\n"
            << "assets,4294967297,,current_assets,$,true\n";
    }
    assert(throws_configuration_error([&]() { load_kpi_registry(aggregates, huge_level); }));

    assert(throws_configuration_error([&]() { load_kpi_registry(aggregates, dir.file("absent.csv")); }));
    assert(throws_configuration_error([&]() { load_kpi_registry(aggregates, ""); }));

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== KPI Registry Test Suite ===\n\n";

    try {
        test_formula_precedence();
        test_formula_null_outcomes();
        test_formula_syntax_errors();
        test_pattern_matching();

        std::cout << "\n";

        test_registry_navigation();
        test_registry_validation();
        test_scope_registry();

        std::cout << "\n";

        test_config_files();
        test_config_file_errors();

        std::cout << "\n=== All tests PASSED ===\n\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}

#include <algorithm>
#include <iostream>
#include <numeric>
#include <random>
#include <set>
#include <variant>
#include <vector>

#include <paretolab/paretolab.hpp>

#include "test_helper.hpp"

using namespace paretolab;
using core::FitnessRecord;
using operators::NicheCountPolicy;
using operators::ReferenceDirectionSurvival;
using operators::SurvivalOptions;

namespace {

/// Twenty mutually non-dominated points on a line
std::vector<FitnessRecord> single_front(std::size_t n = 20) {
    std::vector<FitnessRecord> fitnesses;
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        fitnesses.emplace_back(std::vector<double>{x, static_cast<double>(n - 1) - x});
    }
    return fitnesses;
}

bool distinct(const std::vector<std::size_t>& selected) {
    return std::set<std::size_t>(selected.begin(), selected.end()).size() == selected.size();
}

std::size_t total(std::span<const std::size_t> counts) {
    return std::accumulate(counts.begin(), counts.end(), std::size_t{0});
}

} // namespace

bool test_nsga2_truncation() {
    std::cout << "=== NSGA-II truncation by crowding ===" << std::endl;
    TestResult result;

    const std::vector<FitnessRecord> fitnesses{
        FitnessRecord({1.0, 5.0}), FitnessRecord({2.0, 4.0}), FitnessRecord({3.0, 3.0}),
        FitnessRecord({4.0, 2.0}), FitnessRecord({5.0, 1.0}), FitnessRecord({6.0, 6.0})};

    for (const auto algorithm : {sorting::SortAlgorithm::naive, sorting::SortAlgorithm::fast}) {
        auto survival = factory::make_nsga2(algorithm);
        std::mt19937 rng(1);

        const auto three = survival.select(fitnesses, 3, rng);
        result.assert_true(three.selected == std::vector<std::size_t>{0, 4, 1},
                           "Boundaries first, then the lowest position among equal distances");
        result.assert_eq(std::size_t{0}, three.stats.accepted_fronts, "First front split");
        result.assert_eq(std::size_t{5}, three.stats.last_front_size, "Split front size");

        auto five = survival.select(fitnesses, 5, rng).selected;
        std::ranges::sort(five);
        result.assert_true(five == std::vector<std::size_t>{0, 1, 2, 3, 4},
                           "Exact fit takes the whole first front");
    }

    result.print_summary();
    return result.all_passed();
}

bool test_nsga3_selection() {
    std::cout << "=== NSGA-III selection ===" << std::endl;
    TestResult result;

    std::mt19937 data_rng(2718);
    const auto fitnesses = random_fitnesses(120, 3, data_rng, 20);

    auto survival = factory::make_nsga3(3, 6);
    std::mt19937 rng(42);
    const auto picked = survival.select(fitnesses, 50, rng);

    result.assert_eq(std::size_t{50}, picked.selected.size(), "Exactly k survivors");
    result.assert_true(distinct(picked.selected), "Survivors are distinct");

    const auto sorted = sorting::sort_fronts(fitnesses, 50);
    const std::set<std::size_t> survivors(picked.selected.begin(), picked.selected.end());
    bool accepted_kept = true;
    for (std::size_t f = 0; f < picked.stats.accepted_fronts; ++f) {
        for (const auto position : sorted.fronts[f]) {
            accepted_kept = accepted_kept && survivors.contains(position);
        }
    }
    result.assert_true(accepted_kept, "Every member of an accepted front survives");
    result.assert_true(picked.stats.intercept_source.has_value() ||
                           picked.stats.diversity_filled == 0,
                       "Normalization recorded when niching ran");

    auto again = factory::make_nsga3(3, 6);
    std::mt19937 same_seed(42);
    result.assert_true(again.select(fitnesses, 50, same_seed).selected == picked.selected,
                       "Same seed gives the same survivors");

    result.print_summary();
    return result.all_passed();
}

bool test_edge_sizes() {
    std::cout << "=== Requested sizes at the edges ===" << std::endl;
    TestResult result;

    std::mt19937 data_rng(8);
    const auto fitnesses = random_fitnesses(30, 2, data_rng);
    std::mt19937 rng(3);

    auto nsga3 = factory::make_nsga3(2, 8);
    const auto none = nsga3.select(fitnesses, 0, rng);
    result.assert_true(none.selected.empty(), "k == 0 selects nothing");
    result.assert_eq(std::size_t{0}, none.stats.front_count, "k == 0 does not sort");

    const auto all = nsga3.select(fitnesses, 100, rng);
    result.assert_eq(fitnesses.size(), all.selected.size(), "k > N returns everyone");
    result.assert_true(distinct(all.selected), "Everyone exactly once");

    const std::vector<FitnessRecord> empty;
    result.assert_true(nsga3.select(empty, 5, rng).selected.empty(),
                       "Empty population selects nothing");

    const std::vector<FitnessRecord> mixed{FitnessRecord({1.0, 2.0}), FitnessRecord({1.0})};
    result.assert_throws<core::DimensionMismatchError>(
        [&] { (void)nsga3.select(mixed, 1, rng); }, "Mismatched records rejected");

    result.print_summary();
    return result.all_passed();
}

bool test_constrained_selection() {
    std::cout << "=== Constraint-aware selection ===" << std::endl;
    TestResult result;

    const std::vector<FitnessRecord> fitnesses{FitnessRecord({2.0, 2.0}, {0.0}),
                                               FitnessRecord({1.0, 1.0}, {1.0})};
    std::mt19937 rng(9);

    auto constrained = operators::make_survival(sorting::DynamicSort(),
                                                operators::CrowdingSurvival{},
                                                SurvivalOptions{true, 10});
    result.assert_true(constrained.select(fitnesses, 1, rng).selected ==
                           std::vector<std::size_t>{0},
                       "Feasible individual survives over a better infeasible one");

    auto plain = factory::make_nsga2();
    result.assert_true(plain.select(fitnesses, 1, rng).selected == std::vector<std::size_t>{1},
                       "Without constraints the dominating individual survives");

    const std::vector<FitnessRecord> infeasible{FitnessRecord({1.0, 1.0}, {2.0}),
                                                FitnessRecord({3.0, 3.0}, {0.5}),
                                                FitnessRecord({0.0, 0.0}, {4.0})};
    auto nsga3 = operators::make_survival(
        sorting::DynamicSort(),
        ReferenceDirectionSurvival(niching::uniform_reference_points(2, 4)),
        SurvivalOptions{true, 10});
    const auto least = nsga3.select(infeasible, 1, rng);
    result.assert_true(least.selected == std::vector<std::size_t>{1},
                       "All infeasible: least violator survives");
    result.assert_true(least.stats.all_infeasible, "All-infeasible case reported");

    const auto two = nsga3.select(infeasible, 2, rng);
    result.assert_eq(std::size_t{2}, two.selected.size(), "Second tier fills the rest");
    result.assert_true(two.selected.front() == 1, "Least violator still first");

    result.print_summary();
    return result.all_passed();
}

bool test_niche_count_policies() {
    std::cout << "=== Niche count policies ===" << std::endl;
    TestResult result;

    const auto fitnesses = single_front();
    const auto references = niching::uniform_reference_points(2, 9);

    auto reset = operators::make_survival(sorting::DynamicSort(),
                                          ReferenceDirectionSurvival(references));
    auto carry = operators::make_survival(
        sorting::DynamicSort(), ReferenceDirectionSurvival(references, NicheCountPolicy::carry));

    std::mt19937 rng_a(21);
    std::mt19937 rng_b(21);
    for (int call = 0; call < 2; ++call) {
        (void)reset.select(fitnesses, 10, rng_a);
        (void)carry.select(fitnesses, 10, rng_b);
    }

    result.assert_eq(std::size_t{10}, total(reset.diversity().niche_counts()),
                     "Reset policy counts only the current call");
    result.assert_eq(std::size_t{20}, total(carry.diversity().niche_counts()),
                     "Carry policy accumulates across calls");

    carry.diversity().reset();
    result.assert_true(carry.diversity().niche_counts().empty() &&
                           carry.diversity().memory().empty(),
                       "Reset clears carried state");

    // Fixed references with the wrong number of objectives
    auto mismatched = operators::make_survival(
        sorting::DynamicSort(), ReferenceDirectionSurvival(niching::uniform_reference_points(3, 4)));
    std::mt19937 rng(1);
    result.assert_throws<core::DimensionMismatchError>(
        [&] { (void)mismatched.select(fitnesses, 10, rng); },
        "Reference dimension must match the population");

    result.assert_throws<std::invalid_argument>(
        [] { ReferenceDirectionSurvival empty_refs(std::vector<niching::ReferencePoint>{}); },
        "Empty reference set rejected");

    result.print_summary();
    return result.all_passed();
}

bool test_history() {
    std::cout << "=== Selection history ===" << std::endl;
    TestResult result;

    const auto fitnesses = single_front();
    auto survival = operators::make_survival(sorting::DynamicSort(), operators::CrowdingSurvival{},
                                             SurvivalOptions{false, 3});
    std::mt19937 rng(4);
    for (int call = 0; call < 5; ++call) {
        (void)survival.select(fitnesses, 7, rng);
    }

    const auto& history = survival.history();
    result.assert_eq(std::size_t{3}, history.size(), "History bounded by its limit");
    result.assert_eq(std::size_t{2}, history.front().call, "Oldest records dropped first");
    result.assert_eq(std::size_t{4}, history.back().call, "Latest call kept");
    result.assert_eq(std::size_t{7}, history.back().selected, "Stats record the survivors");
    result.assert_eq(std::size_t{7}, history.back().diversity_filled, "All from the split front");

    survival.clear_history();
    result.assert_true(survival.history().empty(), "History cleared");

    auto silent = operators::make_survival(sorting::DynamicSort(), operators::CrowdingSurvival{},
                                           SurvivalOptions{false, 0});
    (void)silent.select(fitnesses, 7, rng);
    result.assert_true(silent.history().empty(), "Limit 0 keeps no history");

    result.print_summary();
    return result.all_passed();
}

bool test_keys_and_factory() {
    std::cout << "=== Keyed selection and configuration factory ===" << std::endl;
    TestResult result;

    core::Population<> population;
    population.push_back(900, FitnessRecord({1.0, 1.0}));
    population.push_back(901, FitnessRecord({2.0, 2.0}));
    population.push_back(902, FitnessRecord({3.0, 3.0}));

    auto nsga2 = factory::make_nsga2();
    std::mt19937 rng(6);
    const auto keys = nsga2.select_keys(population, 2, rng);
    result.assert_true(keys == std::vector<core::IndividualKey>{900, 901},
                       "Survivors reported by key");

    auto cfg = config::Config::from_string(R"(
[survival]
strategy = "nsga2"
)");
    result.assert_true(std::holds_alternative<factory::Nsga2Survival>(
                           factory::make_survival_from_config(cfg)),
                       "Strategy nsga2 builds a crowding selector");

    cfg.survival.strategy = "nsga3";
    cfg.reference_points.divisions = 4;
    cfg.reference_points.inner_divisions = 2;
    auto any = factory::make_survival_from_config(cfg);
    result.assert_true(std::holds_alternative<factory::Nsga3Survival>(any),
                       "Strategy nsga3 builds a reference-direction selector");

    auto& nsga3 = std::get<factory::Nsga3Survival>(any);
    std::mt19937 data_rng(17);
    const auto fitnesses = random_fitnesses(40, 3, data_rng);
    const auto picked = nsga3.select(fitnesses, 20, rng);
    result.assert_eq(std::size_t{20}, picked.selected.size(), "Configured selector picks k");
    result.assert_eq(niching::reference_point_count(3, 4) + niching::reference_point_count(3, 2),
                     nsga3.diversity().references().size(),
                     "Layered references generated for M = 3");

    result.print_summary();
    return result.all_passed();
}

int main() {
    std::cout << "Running ParetoLab Survival Tests" << std::endl;
    std::cout << "================================" << std::endl;

    bool all_tests_passed = true;

    try {
        all_tests_passed &= test_nsga2_truncation();
        std::cout << std::endl;

        all_tests_passed &= test_nsga3_selection();
        std::cout << std::endl;

        all_tests_passed &= test_edge_sizes();
        std::cout << std::endl;

        all_tests_passed &= test_constrained_selection();
        std::cout << std::endl;

        all_tests_passed &= test_niche_count_policies();
        std::cout << std::endl;

        all_tests_passed &= test_history();
        std::cout << std::endl;

        all_tests_passed &= test_keys_and_factory();
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return all_tests_passed ? 0 : 1;
}

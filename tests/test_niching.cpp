#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <set>
#include <stdexcept>
#include <vector>

#include <paretolab/niching/association.hpp>
#include <paretolab/niching/niching.hpp>

#include "test_helper.hpp"

using namespace paretolab;
using core::FitnessRecord;
using niching::ReferencePoint;

bool test_association() {
    std::cout << "=== Association to reference directions ===" << std::endl;
    TestResult result;

    const std::vector<ReferencePoint> references{{0.0, 1.0}, {0.5, 0.5}, {1.0, 0.0}};
    const std::vector<FitnessRecord> fitnesses{FitnessRecord({0.0, 2.0}), FitnessRecord({1.0, 1.0}),
                                               FitnessRecord({3.0, 0.1})};
    const std::vector<std::size_t> positions{0, 1, 2};
    const std::vector<double> ideal{0.0, 0.0};
    const std::vector<double> intercepts{1.0, 1.0};

    const auto association =
        niching::associate_to_niches(fitnesses, positions, references, ideal, intercepts);
    result.assert_true(association.niches == std::vector<std::size_t>{0, 1, 2},
                       "Each point joins the direction it lies along");
    result.assert_equals(0.0, association.distances[0], "On-axis point has zero distance");
    result.assert_equals(0.0, association.distances[1], "Diagonal point has zero distance");
    result.assert_equals(0.1, association.distances[2], "Perpendicular distance to the axis");

    // Normalization stretches axis 1 so (2, 4) lands on the diagonal
    const std::vector<FitnessRecord> stretched{FitnessRecord({2.0, 4.0})};
    const std::vector<std::size_t> first{0};
    const std::vector<double> uneven{2.0, 4.0};
    const auto normalized =
        niching::associate_to_niches(stretched, first, references, ideal, uneven);
    result.assert_eq(std::size_t{1}, normalized.niches[0], "Objectives are normalized first");
    result.assert_equals(0.0, normalized.distances[0], "Normalized point on the diagonal");

    // Equidistant from both axes: the lower index wins
    const std::vector<ReferencePoint> axes{{1.0, 0.0}, {0.0, 1.0}};
    const auto tie = niching::associate_to_niches(fitnesses, std::vector<std::size_t>{1}, axes,
                                                  ideal, intercepts);
    result.assert_eq(std::size_t{0}, tie.niches[0], "Ties go to the lowest reference index");

    result.print_summary();
    return result.all_passed();
}

bool test_association_errors() {
    std::cout << "=== Association argument checks ===" << std::endl;
    TestResult result;

    const std::vector<FitnessRecord> fitnesses{FitnessRecord({1.0, 1.0})};
    const std::vector<std::size_t> positions{0};
    const std::vector<double> ideal{0.0, 0.0};
    const std::vector<double> intercepts{1.0, 1.0};

    const std::vector<ReferencePoint> with_zero{{1.0, 0.0}, {0.0, 0.0}};
    result.assert_throws<std::invalid_argument>(
        [&] {
            (void)niching::associate_to_niches(fitnesses, positions, with_zero, ideal, intercepts);
        },
        "Zero-norm reference rejected");

    const std::vector<ReferencePoint> none;
    result.assert_throws<std::invalid_argument>(
        [&] { (void)niching::associate_to_niches(fitnesses, positions, none, ideal, intercepts); },
        "Empty reference set rejected");

    const std::vector<ReferencePoint> three_d{{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}};
    result.assert_throws<core::DimensionMismatchError>(
        [&] {
            (void)niching::associate_to_niches(fitnesses, positions, three_d, ideal, intercepts);
        },
        "Reference dimension must match the objectives");

    result.print_summary();
    return result.all_passed();
}

bool test_niching_basics() {
    std::cout << "=== Least-used-niche selection ===" << std::endl;
    TestResult result;

    std::mt19937 rng(11);
    std::uniform_int_distribution<std::size_t> niche_of(0, 9);
    std::uniform_real_distribution<double> distance(0.0, 1.0);

    bool exact = true;
    bool distinct = true;
    bool counted = true;
    for (int trial = 0; trial < 100; ++trial) {
        const std::size_t n = 1 + static_cast<std::size_t>(trial % 40);
        std::vector<std::size_t> niches(n);
        std::vector<double> distances(n);
        for (std::size_t i = 0; i < n; ++i) {
            niches[i] = niche_of(rng);
            distances[i] = distance(rng);
        }
        std::vector<std::size_t> counts(10, 0);
        for (auto& c : counts) {
            c = static_cast<std::size_t>(trial % 3);
        }
        const auto before = counts;

        const std::size_t k = (n + 1) / 2;
        const auto picks = niching::select_by_niching(niches, distances, k, counts, rng);

        exact = exact && picks.size() == k;
        distinct = distinct && std::set<std::size_t>(picks.begin(), picks.end()).size() == k;

        auto expected = before;
        for (const auto pick : picks) {
            ++expected[niches[pick]];
        }
        counted = counted && expected == counts;
    }

    result.assert_true(exact, "Exactly k members picked");
    result.assert_true(distinct, "No member picked twice");
    result.assert_true(counted, "Niche counts incremented once per pick");

    result.print_summary();
    return result.all_passed();
}

bool test_niching_deterministic_cases() {
    std::cout << "=== Niching edge cases ===" << std::endl;
    TestResult result;

    std::mt19937 rng(5);

    // Niche 0 is empty, so its closest member is taken
    {
        const std::vector<std::size_t> niches{0, 0, 1};
        const std::vector<double> distances{0.5, 0.1, 0.3};
        std::vector<std::size_t> counts{0, 5};
        const auto picks = niching::select_by_niching(niches, distances, 1, counts, rng);
        result.assert_true(picks == std::vector<std::size_t>{1}, "Closest member of empty niche");
        result.assert_true(counts == std::vector<std::size_t>{1, 5}, "Count of niche 0 raised");
    }

    // k larger than the front returns every member
    {
        const std::vector<std::size_t> niches{2, 0, 2};
        const std::vector<double> distances{0.2, 0.4, 0.6};
        std::vector<std::size_t> counts(3, 0);
        auto picks = niching::select_by_niching(niches, distances, 10, counts, rng);
        std::ranges::sort(picks);
        result.assert_true(picks == std::vector<std::size_t>{0, 1, 2}, "k > L returns all");
    }

    // Same seed, same picks
    {
        const std::vector<std::size_t> niches{0, 1, 1, 2, 2, 2, 3, 3};
        const std::vector<double> distances{0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.7, 0.8};
        std::vector<std::size_t> counts_a{1, 1, 1, 1};
        std::vector<std::size_t> counts_b{1, 1, 1, 1};
        std::mt19937 rng_a(77);
        std::mt19937 rng_b(77);
        const auto a = niching::select_by_niching(niches, distances, 5, counts_a, rng_a);
        const auto b = niching::select_by_niching(niches, distances, 5, counts_b, rng_b);
        result.assert_true(a == b && counts_a == counts_b, "Selection reproducible under a seed");
    }

    {
        const std::vector<std::size_t> niches{0, 3};
        const std::vector<double> distances{0.1, 0.2};
        std::vector<std::size_t> counts(2, 0);
        result.assert_throws<std::invalid_argument>(
            [&] { (void)niching::select_by_niching(niches, distances, 1, counts, rng); },
            "Niche index out of range rejected");

        const std::vector<double> short_distances{0.1};
        result.assert_throws<std::invalid_argument>(
            [&] { (void)niching::select_by_niching(niches, short_distances, 1, counts, rng); },
            "Mismatched lengths rejected");
    }

    result.assert_throws<std::invalid_argument>(
        [] { (void)niching::count_niches(std::vector<std::size_t>{0, 4}, 3); },
        "count_niches checks the range");
    result.assert_true(niching::count_niches(std::vector<std::size_t>{0, 2, 2}, 3) ==
                           std::vector<std::size_t>{1, 0, 2},
                       "count_niches tallies each index");

    result.print_summary();
    return result.all_passed();
}

int main() {
    std::cout << "Running ParetoLab Niching Tests" << std::endl;
    std::cout << "===============================" << std::endl;

    bool all_tests_passed = true;

    try {
        all_tests_passed &= test_association();
        std::cout << std::endl;

        all_tests_passed &= test_association_errors();
        std::cout << std::endl;

        all_tests_passed &= test_niching_basics();
        std::cout << std::endl;

        all_tests_passed &= test_niching_deterministic_cases();
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return all_tests_passed ? 0 : 1;
}

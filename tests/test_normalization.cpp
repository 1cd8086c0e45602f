#include <cmath>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>

#include <paretolab/niching/normalization.hpp>

#include "test_helper.hpp"

using namespace paretolab;
using core::FitnessRecord;
using niching::InterceptSource;
using niching::Point;

namespace {

bool points_equal(const Point& expected, const Point& actual, double tolerance = 1e-9) {
    if (expected.size() != actual.size()) {
        return false;
    }
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (std::abs(expected[i] - actual[i]) > tolerance) {
            return false;
        }
    }
    return true;
}

} // namespace

bool test_ideal_and_worst() {
    std::cout << "=== Ideal and worst points ===" << std::endl;
    TestResult result;

    const std::vector<FitnessRecord> fitnesses{FitnessRecord({3.0, 1.0, 4.0}),
                                               FitnessRecord({1.0, 5.0, 9.0}),
                                               FitnessRecord({2.0, 6.0, 5.0})};
    const std::vector<std::size_t> all{0, 1, 2};
    const std::vector<std::size_t> some{0, 2};

    result.assert_true(niching::ideal_point(fitnesses, all) == Point{1.0, 1.0, 4.0},
                       "Ideal is the component-wise minimum");
    result.assert_true(niching::worst_point(fitnesses, all) == Point{3.0, 6.0, 9.0},
                       "Worst is the component-wise maximum");
    result.assert_true(niching::ideal_point(fitnesses, some) == Point{2.0, 1.0, 4.0},
                       "Only the listed positions count");

    const std::vector<std::size_t> none;
    result.assert_throws<std::invalid_argument>(
        [&] { (void)niching::ideal_point(fitnesses, none); }, "Empty positions rejected");

    result.print_summary();
    return result.all_passed();
}

bool test_extreme_points() {
    std::cout << "=== Extreme points ===" << std::endl;
    TestResult result;

    const std::vector<FitnessRecord> fitnesses{
        FitnessRecord({1.0, 0.0}), FitnessRecord({0.0, 1.0}), FitnessRecord({0.5, 0.5})};
    const std::vector<std::size_t> all{0, 1, 2};
    const Point ideal{0.0, 0.0};

    const auto extremes = niching::find_extreme_points(fitnesses, all, ideal);
    result.assert_eq(std::size_t{2}, extremes.size(), "One extreme per axis");
    result.assert_true(extremes[0] == Point{1.0, 0.0}, "Axis 0 extreme lies on axis 0");
    result.assert_true(extremes[1] == Point{0.0, 1.0}, "Axis 1 extreme lies on axis 1");

    // A previous extreme closer to the axis replaces the current candidate
    const std::vector<Point> previous{{2.0, 0.0}, {0.0, 0.5}};
    const std::vector<std::size_t> middle{2};
    const auto merged = niching::find_extreme_points(fitnesses, middle, ideal, previous);
    result.assert_true(merged[0] == Point{2.0, 0.0}, "Previous axis-0 extreme kept");
    result.assert_true(merged[1] == Point{0.0, 0.5}, "Previous axis-1 extreme kept");

    result.print_summary();
    return result.all_passed();
}

bool test_intercepts_hyperplane() {
    std::cout << "=== Intercepts from the hyperplane ===" << std::endl;
    TestResult result;

    const std::vector<Point> extremes{{1.0, 0.0, 0.0}, {0.0, 2.0, 0.0}, {0.0, 0.0, 3.0}};
    const Point ideal{0.0, 0.0, 0.0};
    const Point current_worst{5.0, 5.0, 5.0};
    const Point front_worst{4.0, 4.0, 4.0};

    const auto intercepts = niching::find_intercepts(extremes, ideal, current_worst, front_worst);
    result.assert_true(intercepts.source == InterceptSource::hyperplane, "Hyperplane used");
    result.assert_true(points_equal({1.0, 2.0, 3.0}, intercepts.values),
                       "Intercepts of a diagonal system");

    // Offsets are measured from a shifted ideal point
    const std::vector<Point> shifted{{2.0, 1.0}, {1.0, 3.0}};
    const Point shifted_ideal{1.0, 1.0};
    const auto offsets =
        niching::find_intercepts(shifted, shifted_ideal, Point{4.0, 4.0}, Point{3.0, 3.0});
    result.assert_true(offsets.source == InterceptSource::hyperplane, "Shifted hyperplane used");
    result.assert_true(points_equal({1.0, 2.0}, offsets.values), "Intercepts relative to ideal");

    result.print_summary();
    return result.all_passed();
}

bool test_intercepts_fallbacks() {
    std::cout << "=== Intercept fallbacks ===" << std::endl;
    TestResult result;

    const Point origin{0.0, 0.0};

    const auto singular = niching::find_intercepts(std::vector<Point>{{1.0, 1.0}, {1.0, 1.0}},
                                                   origin, Point{4.0, 6.0}, Point{2.0, 2.0});
    result.assert_true(singular.source == InterceptSource::current_worst,
                       "Singular system falls back to the current worst point");
    result.assert_true(points_equal({4.0, 6.0}, singular.values), "Current worst offsets");

    const auto negative = niching::find_intercepts(std::vector<Point>{{-1.0, 0.0}, {0.0, 1.0}},
                                                   origin, Point{5.0, 5.0}, Point{2.0, 3.0});
    result.assert_true(negative.source == InterceptSource::front_worst,
                       "Negative intercept falls back to the front worst point");
    result.assert_true(points_equal({2.0, 3.0}, negative.values), "Front worst offsets");

    const auto beyond = niching::find_intercepts(std::vector<Point>{{10.0, 0.0}, {0.0, 10.0}},
                                                 origin, Point{5.0, 5.0}, Point{4.0, 4.0});
    result.assert_true(beyond.source == InterceptSource::front_worst,
                       "Intercept past the current worst point falls back");
    result.assert_true(points_equal({4.0, 4.0}, beyond.values), "Front worst offsets");

    const auto zero = niching::find_intercepts(std::vector<Point>{{1.0, 5.0}, {1.0, 7.0}},
                                               origin, Point{9.0, 9.0}, Point{3.0, 8.0});
    result.assert_true(zero.source == InterceptSource::front_worst,
                       "Zero solution component falls back");
    result.assert_true(points_equal({3.0, 8.0}, zero.values), "Front worst offsets");

    const auto flat = niching::find_intercepts(std::vector<Point>{{1.0, 1.0}, {1.0, 1.0}},
                                               origin, Point{3.0, 0.0}, Point{2.0, 0.0});
    result.assert_true(points_equal({3.0, 1.0}, flat.values),
                       "Zero offset replaced by a unit scale");

    result.assert_throws<core::DimensionMismatchError>(
        [&] {
            (void)niching::find_intercepts(std::vector<Point>{{1.0, 0.0}}, origin, origin, origin);
        },
        "Wrong number of extreme points rejected");

    result.print_summary();
    return result.all_passed();
}

bool test_intercepts_always_positive() {
    std::cout << "=== Intercepts positive on arbitrary input ===" << std::endl;
    TestResult result;

    std::mt19937 rng(4242);
    std::uniform_real_distribution<double> coord(-3.0, 3.0);
    std::bernoulli_distribution duplicate(0.2);

    bool all_positive = true;
    for (int trial = 0; trial < 500; ++trial) {
        const std::size_t m = 2 + static_cast<std::size_t>(trial % 4);

        std::vector<Point> extremes(m, Point(m));
        for (std::size_t i = 0; i < m; ++i) {
            for (auto& v : extremes[i]) {
                v = coord(rng);
            }
            if (i > 0 && duplicate(rng)) {
                extremes[i] = extremes[i - 1];
            }
        }
        Point ideal(m);
        Point current_worst(m);
        Point front_worst(m);
        for (std::size_t i = 0; i < m; ++i) {
            ideal[i] = coord(rng);
            current_worst[i] = coord(rng);
            front_worst[i] = coord(rng);
        }

        const auto intercepts = niching::find_intercepts(extremes, ideal, current_worst, front_worst);
        for (const auto v : intercepts.values) {
            all_positive = all_positive && std::isfinite(v) && v > niching::kInterceptFloor;
        }
    }

    result.assert_true(all_positive, "Every intercept is finite and above the floor");

    result.print_summary();
    return result.all_passed();
}

bool test_normalization_memory() {
    std::cout << "=== Normalization memory ===" << std::endl;
    TestResult result;

    niching::NormalizationMemory memory;
    result.assert_true(memory.empty(), "Memory starts empty");
    result.assert_true(memory.merged_ideal(Point{2.0, 2.0}) == Point{2.0, 2.0},
                       "Empty memory passes the current ideal through");

    memory.update(Point{1.0, 1.0}, Point{3.0, 3.0}, {{3.0, 1.0}, {1.0, 3.0}});
    memory.update(Point{0.0, 2.0}, Point{2.0, 4.0}, {{2.0, 2.0}, {0.0, 4.0}});

    result.assert_true(memory.ideal() == Point{0.0, 1.0}, "Ideal never regresses");
    result.assert_true(memory.worst() == Point{3.0, 4.0}, "Worst only grows");
    result.assert_eq(std::size_t{2}, memory.extremes().size(), "Last extremes kept");
    result.assert_true(memory.extremes()[1] == Point{0.0, 4.0}, "Extremes replaced on update");

    result.assert_true(memory.merged_ideal(Point{2.0, 0.0}) == Point{0.0, 0.0},
                       "Merged ideal takes the better value per axis");
    result.assert_true(memory.merged_worst(Point{5.0, 1.0}) == Point{5.0, 4.0},
                       "Merged worst takes the worse value per axis");

    result.assert_throws<core::DimensionMismatchError>(
        [&] { memory.update(Point{0.0, 0.0, 0.0}, Point{1.0, 1.0, 1.0}, {}); },
        "Changing M between generations rejected");

    memory.reset();
    result.assert_true(memory.empty() && memory.extremes().empty(), "Reset forgets everything");

    result.print_summary();
    return result.all_passed();
}

int main() {
    std::cout << "Running ParetoLab Normalization Tests" << std::endl;
    std::cout << "=====================================" << std::endl;

    bool all_tests_passed = true;

    try {
        all_tests_passed &= test_ideal_and_worst();
        std::cout << std::endl;

        all_tests_passed &= test_extreme_points();
        std::cout << std::endl;

        all_tests_passed &= test_intercepts_hyperplane();
        std::cout << std::endl;

        all_tests_passed &= test_intercepts_fallbacks();
        std::cout << std::endl;

        all_tests_passed &= test_intercepts_always_positive();
        std::cout << std::endl;

        all_tests_passed &= test_normalization_memory();
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return all_tests_passed ? 0 : 1;
}

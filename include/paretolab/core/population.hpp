#pragma once

/// @file population.hpp
/// @brief Keyed population with Structure-of-Arrays layout and PMR support
///
/// The selection engine only reads fitness records. Keys, decision vectors and strategy
/// vectors are stored beside them so results can be reported by stable key without the
/// engine ever touching the caller's representation.

#include <memory_resource>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <paretolab/core/concepts.hpp>

namespace paretolab::core {

/// Population class with Structure-of-Arrays layout
///
/// Positions are dense indices `0..size()-1` in insertion order; every sorter and selector
/// works on positions and the population translates them back to keys.
///
/// @tparam DecisionT Decision vector type (opaque to the engine)
/// @tparam StrategyT Strategy vector type (opaque to the engine)
template <typename DecisionT = std::vector<double>, typename StrategyT = std::vector<double>>
class Population {
  private:
    std::pmr::vector<IndividualKey> keys_;
    std::pmr::vector<DecisionT> decisions_;
    std::pmr::vector<StrategyT> strategies_;
    std::pmr::vector<FitnessRecord> fitness_;
    std::unordered_map<IndividualKey, std::size_t> positions_;

  public:
    /// Construct population with specified capacity and optional custom memory resource
    ///
    /// @param capacity Number of individuals to pre-allocate for
    /// @param resource Custom memory resource for allocation (default: global default)
    explicit Population(std::size_t capacity = 0,
                        std::pmr::memory_resource* resource = std::pmr::get_default_resource())
        : keys_(std::pmr::polymorphic_allocator<IndividualKey>(resource)),
          decisions_(std::pmr::polymorphic_allocator<DecisionT>(resource)),
          strategies_(std::pmr::polymorphic_allocator<StrategyT>(resource)),
          fitness_(std::pmr::polymorphic_allocator<FitnessRecord>(resource)) {
        reserve(capacity);
    }

    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }

    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

    void reserve(std::size_t new_cap) {
        keys_.reserve(new_cap);
        decisions_.reserve(new_cap);
        strategies_.reserve(new_cap);
        fitness_.reserve(new_cap);
        positions_.reserve(new_cap);
    }

    /// Add an individual to the population
    ///
    /// @throws std::invalid_argument if the key is already present
    /// @throws std::exception Strong exception safety guarantee
    void push_back(IndividualKey key, DecisionT decision, StrategyT strategy,
                   FitnessRecord fitness) {
        if (positions_.contains(key)) {
            throw std::invalid_argument("Duplicate individual key " + std::to_string(key));
        }

        const std::size_t position = keys_.size();

        keys_.push_back(key);
        try {
            decisions_.push_back(std::move(decision));
            strategies_.push_back(std::move(strategy));
            fitness_.push_back(std::move(fitness));
            positions_.emplace(key, position);
        } catch (...) {
            // Restore the size invariant across all arrays before rethrowing
            keys_.pop_back();
            if (decisions_.size() > position) {
                decisions_.pop_back();
            }
            if (strategies_.size() > position) {
                strategies_.pop_back();
            }
            if (fitness_.size() > position) {
                fitness_.pop_back();
            }
            throw;
        }
    }

    /// Add an individual that only carries a fitness record
    void push_back(IndividualKey key, FitnessRecord fitness) {
        push_back(key, DecisionT{}, StrategyT{}, std::move(fitness));
    }

    [[nodiscard]] IndividualKey key(std::size_t position) const noexcept {
        return keys_[position];
    }

    [[nodiscard]] const DecisionT& decision(std::size_t position) const noexcept {
        return decisions_[position];
    }

    [[nodiscard]] const StrategyT& strategy(std::size_t position) const noexcept {
        return strategies_[position];
    }

    [[nodiscard]] const FitnessRecord& fitness(std::size_t position) const noexcept {
        return fitness_[position];
    }

    /// Position of a key
    ///
    /// @throws std::out_of_range if the key is unknown
    [[nodiscard]] std::size_t position_of(IndividualKey key) const { return positions_.at(key); }

    [[nodiscard]] bool contains(IndividualKey key) const { return positions_.contains(key); }

    [[nodiscard]] std::span<const IndividualKey> keys() const {
        return {keys_.data(), keys_.size()};
    }

    /// Get const span over all fitness records for batch operations
    [[nodiscard]] std::span<const FitnessRecord> fitness_values() const {
        return {fitness_.data(), fitness_.size()};
    }

    /// Translate positions into keys
    [[nodiscard]] std::vector<IndividualKey> keys_of(std::span<const std::size_t> positions) const {
        std::vector<IndividualKey> out;
        out.reserve(positions.size());
        for (const auto position : positions) {
            out.push_back(keys_.at(position));
        }
        return out;
    }

    void clear() noexcept {
        keys_.clear();
        decisions_.clear();
        strategies_.clear();
        fitness_.clear();
        positions_.clear();
    }

    [[nodiscard]] std::pmr::memory_resource* get_memory_resource() const noexcept {
        return keys_.get_allocator().resource();
    }
};

} // namespace paretolab::core

/// @file Vose.hpp
/// Alias table for O(1) sampling of a weighted outcome list (Vose's method).
///
/// The table is built once in O(n) and every draw then costs exactly two
/// uniform random numbers, whatever the number of outcomes. See M. D. Vose,
/// "A Linear Algorithm For Generating Random Numbers With a Given
/// Distribution", and http://www.keithschwarz.com/darts-dice-coins/.
#pragma once
#include "Errors.hpp"
#include <cmath>
#include <fmt/format.h>
#include <random>
#include <utility>
#include <vector>

namespace pdo::search
{

/// Loaded die over outcomes of type @p T.
template <typename T>
class Vose
{
public:

    /// A (weight, outcome) pair. Weights need not be normalised.
    using Element = std::pair<double, T>;

    /// Build the alias table.
    /// @param elements  Non-empty list of (weight, outcome) pairs, all
    ///                  weights >= 0 with a strictly positive sum.
    /// @throws InvalidDistribution otherwise.
    explicit Vose(std::vector<Element> elements)
    {
        double total = 0.0;
        for (size_t i = 0; i < elements.size(); ++i)
        {
            const double w = elements[i].first;
            if (!std::isfinite(w) || w < 0.0)
                throw InvalidDistribution(fmt::format(
                    "weight #{} must be finite and >= 0, got {}", i, w));
            total += w;
        }
        if (!(total > 0.0))
            throw InvalidDistribution(
                "the weights of the outcomes must sum to more than 0");

        // Scale so that the average weight is 1
        const double n = static_cast<double>(elements.size());
        std::vector<Element> small, large;
        for (auto& e : elements)
        {
            e.first = e.first * n / total;
            if (e.first < 1.0)
                small.push_back(std::move(e));
            else
                large.push_back(std::move(e));
        }

        prob_.reserve(elements.size());
        alias_.reserve(elements.size());
        while (!small.empty() && !large.empty())
        {
            Element s = std::move(small.back());
            small.pop_back();
            Element l = std::move(large.back());
            large.pop_back();

            prob_.push_back(s.first);
            alias_.emplace_back(s.second, l.second);

            // What is left of the large element after filling the slot
            l.first = (l.first + s.first) - 1.0;
            if (l.first < 1.0)
                small.push_back(std::move(l));
            else
                large.push_back(std::move(l));
        }

        // Leftovers (exactly 1 up to rounding) occupy a whole slot each
        for (auto* bucket : { &large, &small })
        {
            while (!bucket->empty())
            {
                prob_.push_back(1.0);
                alias_.emplace_back(bucket->back().second,
                                    bucket->back().second);
                bucket->pop_back();
            }
        }
    }

    /// Draw one outcome with probability proportional to its weight.
    template <class URBG>
    const T& random(URBG& rng) const
    {
        std::uniform_int_distribution<size_t> slot(0, prob_.size() - 1);
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        const size_t i = slot(rng);
        return (prob_[i] >= coin(rng)) ? alias_[i].first : alias_[i].second;
    }

    /// Number of slots in the table (equals the number of outcomes).
    size_t size() const
    {
        return prob_.size();
    }

    /// Cutoff probability of the primary outcome of a slot.
    double cutoff(size_t slot) const
    {
        return prob_.at(slot);
    }

    /// (primary, alias) outcomes of a slot.
    const std::pair<T, T>& slot(size_t i) const
    {
        return alias_.at(i);
    }

private:

    std::vector<double> prob_;
    std::vector<std::pair<T, T>> alias_;
};

} // namespace pdo::search

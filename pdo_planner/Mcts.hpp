/// @file Mcts.hpp
/// Monte-Carlo Tree Search driver with UCB1 selection and PROST-style
/// state/action layers for stochastic action outcomes.
///
/// Each iteration (1) selects a node by descending the tree with the
/// selection policy, (2) expands one untried action of that node,
/// (3) rolls out along most probable outcomes up to the horizon or a goal,
/// and (4) backpropagates the discounted reward to the root.
#pragma once
#include "Budget.hpp"
#include "Policy.hpp"
#include "SearchTree.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace pdo::search
{

/// Configuration of the MCTS driver.
struct SearchConfig
{
    size_t horizon = 50;       ///< Maximum lookahead depth per iteration.
    double discounting = 0.9;  ///< Per-depth reward decay, in (0, 1].
    std::optional<uint64_t> seed; ///< Fixed seed, or none for a random one.
    bool verbose = false;      ///< Trace every iteration on stderr.
};

/// Outcome of one search.
struct SearchResult
{
    bool success = false; ///< False when the root offered no action to try.
    ActionId action = 0;  ///< Best root action (meaningful if @c success).
    std::vector<ActionStats> actions; ///< Root statistics, in trial order.
    size_t iterations = 0;
    size_t tree_size = 0; ///< Number of nodes built.
};

/// MCTS driver. Owns the random engine shared by sampling and policies.
class Mcts
{
public:

    /// @param policy  Heuristics to use; nullptr selects DefaultPolicy.
    /// @throws std::invalid_argument if @c config.discounting is outside
    ///         (0, 1].
    explicit Mcts(SearchConfig config = {},
                  std::shared_ptr<const SearchPolicy> policy = nullptr);

    /// Run iterations on @p tree while @p budget allows it, then choose the
    /// best root action with the policy's final choice.
    SearchResult search(SearchTree& tree, const Budget& budget);

    /// Search from a fresh tree rooted at @p root_state.
    SearchResult search(const Problem& problem,
                        const WorldState& root_state,
                        const Budget& budget);

    const SearchConfig& get_config() const;
    const SearchPolicy& get_policy() const;
    RandomEngine& get_rng();

private:

    /// One select/expand/rollout/backpropagate cycle.
    void iterate(SearchTree& tree, size_t iteration);

    SearchConfig config_;
    std::shared_ptr<const SearchPolicy> policy_;
    RandomEngine rng_;
};

} // namespace pdo::search

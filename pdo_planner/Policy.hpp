/// @file Policy.hpp
/// Pluggable heuristics for the four decisions taken by the MCTS driver.
#pragma once
#include "SearchTree.hpp"
#include <cmath>
#include <vector>

namespace pdo::search
{

/// One method per decision point of an MCTS iteration.
///
/// Implementations may override any subset by deriving from DefaultPolicy.
class SearchPolicy
{
public:

    virtual ~SearchPolicy() = default;

    /// Step 1 (select): choose among the tried actions of @p node.
    virtual ActionId select_action(const SearchTree& tree,
                                   NodeId node,
                                   RandomEngine& rng) const = 0;

    /// Step 2 (expand): choose among the untried actions of @p node.
    virtual ActionId expand_action(const SearchTree& tree,
                                   NodeId node,
                                   RandomEngine& rng) const = 0;

    /// Step 3 (rollout): choose among the applicable actions of @p node.
    virtual ActionId rollout_action(const SearchTree& tree,
                                    NodeId node,
                                    RandomEngine& rng) const = 0;

    /// Final choice among the root statistics (never empty, visits > 0).
    virtual ActionId select_best(const std::vector<ActionStats>& actions) const = 0;
};

/// UCB1 selection, uniform expansion and rollout, best average reward.
class DefaultPolicy: public SearchPolicy
{
public:

    /// @param exploration  Weight of the UCB1 exploration term.
    explicit DefaultPolicy(double exploration = 1.0 / std::sqrt(2.0));

    /// UCB1: maximise c·√(ln N / n_a) + R_a / n_a, first best on ties.
    ActionId select_action(const SearchTree& tree,
                           NodeId node,
                           RandomEngine& rng) const override;

    /// Uniformly random untried action.
    ActionId expand_action(const SearchTree& tree,
                           NodeId node,
                           RandomEngine& rng) const override;

    /// Uniformly random applicable action.
    ActionId rollout_action(const SearchTree& tree,
                            NodeId node,
                            RandomEngine& rng) const override;

    /// Highest reward / visits, first best on ties.
    ActionId select_best(const std::vector<ActionStats>& actions) const override;

    double get_exploration() const;

private:

    double exploration_;
};

/// UCB1 score of a tried action from a node visited @p node_visits times.
/// Unvisited actions score +infinity.
double ucb1_score(const ActionStats& stats,
                  size_t node_visits,
                  double exploration);

} // namespace pdo::search

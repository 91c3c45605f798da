/// @file SearchTree.hpp
/// Lookahead tree with alternating state/action layers (PROST style).
///
/// Nodes live in an arena owned by the tree and refer to each other by
/// index. A state node owns its children through its child map, keyed by
/// the (action, effect) pair that produced them, so an action with several
/// outcomes has one child per outcome met so far. The parent index is only
/// used to walk back up during backpropagation.
#pragma once
#include "Model.hpp"
#include <limits>
#include <map>
#include <utility>
#include <vector>

namespace pdo::search
{

class SearchPolicy;

/// Index of a node inside its SearchTree.
using NodeId = size_t;

/// Parent index of the root node.
constexpr NodeId NO_NODE = std::numeric_limits<NodeId>::max();

/// Identity of the transition leading to a child: (action, effect).
using ChildKey = std::pair<ActionId, EffectId>;

/// Accumulated statistics of an action tried from a node.
struct ActionStats
{
    ActionId action = 0; ///< The tried action.
    double reward = 0.0; ///< Sum of discounted rewards backpropagated.
    size_t visits = 0;   ///< Number of backpropagations through it.
};

/// One reachable state of the lookahead tree.
struct SearchNode
{
    NodeId parent = NO_NODE;
    ChildKey edge{};        ///< Transition from the parent (unused at root).
    WorldState state;
    bool is_goal = false;   ///< Computed once, at construction.
    std::map<ChildKey, NodeId> children;
    size_t visits = 0;
    double utility = 0.0;   ///< Cumulative discounted reward.
    std::vector<ActionId> applicable_actions;
    std::vector<ActionId> untried_actions;
    std::vector<ActionStats> tried_actions; ///< In the order they were tried.

    bool is_root() const;

    /// Goal state, or a state where no action applies.
    bool is_terminal() const;

    /// Statistics of a tried action, or nullptr if it was never tried here.
    const ActionStats* find_tried(ActionId action) const;
    ActionStats* find_tried(ActionId action);
};

/// Terminal node and depth reached by a rollout.
struct RolloutResult
{
    NodeId node;
    size_t depth;
};

/// Search tree of one planning episode.
///
/// The problem must outlive the tree. Nodes are never deleted while the
/// tree lives; NodeIds therefore stay valid, references to nodes do not
/// (any call that grows the tree may move them).
class SearchTree
{
public:

    /// Create the tree with a single root node for @p root_state.
    SearchTree(const Problem& problem, WorldState root_state);

    const Problem& get_problem() const;

    NodeId root() const;

    const SearchNode& node(NodeId id) const;

    /// Number of nodes in the tree.
    size_t size() const;

    /// Resolve one effect of @p action from node @p id and return the child
    /// it leads to, creating it on first encounter of that (action, effect).
    /// Untried/tried bookkeeping is left untouched.
    /// @param most_probable  Take the most probable effect instead of
    ///                       sampling one.
    NodeId simulate_action(NodeId id,
                           ActionId action,
                           RandomEngine& rng,
                           bool most_probable = false);

    /// Expansion primitive: move @p action from the untried to the tried
    /// actions of node @p id (with zero statistics), then simulate it.
    /// @throws IllegalAction if @p action is not untried in node @p id.
    NodeId perform_action(NodeId id, ActionId action, RandomEngine& rng);

    /// Simulate most-probable transitions chosen by @p policy from node
    /// @p id until a goal, a state without applicable actions, or
    /// @p horizon is reached.
    /// @param depth  Depth of node @p id in the current iteration.
    RolloutResult rollout_actions(NodeId id,
                                  const SearchPolicy& policy,
                                  RandomEngine& rng,
                                  size_t depth,
                                  size_t horizon);

    /// Backpropagate the discounted reward collected from node @p id to the
    /// root. Only transitions through tried actions update statistics;
    /// nodes reached by pure simulation are passed through.
    void update(NodeId id, double discounting);

    /// Statistics of the actions tried from the root, in trial order.
    const std::vector<ActionStats>& root_statistics() const;

private:

    NodeId add_node(NodeId parent, ChildKey edge, WorldState state);

    const Problem* problem_;
    std::vector<SearchNode> nodes_;
};

} // namespace pdo::search

#include "Mcts.hpp"
#include <iostream>
#include <random>
#include <stdexcept>

namespace pdo::search
{

static uint64_t make_seed(const std::optional<uint64_t>& seed)
{
    if (seed)
        return *seed;
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

Mcts::Mcts(SearchConfig config, std::shared_ptr<const SearchPolicy> policy)
    : config_(config),
      policy_(policy ? std::move(policy) : std::make_shared<DefaultPolicy>()),
      rng_(make_seed(config.seed))
{
    if (!(config_.discounting > 0.0 && config_.discounting <= 1.0))
        throw std::invalid_argument("discounting must lie in (0, 1]");
}

const SearchConfig& Mcts::get_config() const
{
    return config_;
}

const SearchPolicy& Mcts::get_policy() const
{
    return *policy_;
}

RandomEngine& Mcts::get_rng()
{
    return rng_;
}

void Mcts::iterate(SearchTree& tree, size_t iteration)
{
    const Problem& problem = tree.get_problem();
    const size_t horizon = config_.horizon;
    NodeId node = tree.root();
    size_t depth = 1;

    if (config_.verbose)
        std::cerr << "[mcts] iteration " << iteration << " from "
                  << tree.node(node).state << "\n";

    // (1) Select: descend through fully expanded nodes
    while (depth <= horizon)
    {
        const SearchNode& n = tree.node(node);
        if (!n.untried_actions.empty() || n.children.empty() ||
            n.tried_actions.empty())
            break;
        ActionId action = policy_->select_action(tree, node, rng_);
        if (config_.verbose)
            std::cerr << "[mcts]   select -> "
                      << problem.get_action(action).get_name() << "\n";
        node = tree.simulate_action(node, action, rng_);
        ++depth;
    }

    // (2) Expand: grow the tree by one tried action
    const SearchNode& selected = tree.node(node);
    if (!selected.untried_actions.empty() && depth <= horizon &&
        !selected.is_goal)
    {
        ActionId action = policy_->expand_action(tree, node, rng_);
        node = tree.perform_action(node, action, rng_);
        ++depth;
        if (config_.verbose)
            std::cerr << "[mcts]   expand -> "
                      << problem.get_action(action).get_name() << " gives "
                      << tree.node(node).state << "\n";
    }

    // (3) Rollout: simulate beyond the tracked tree
    RolloutResult rollout =
        tree.rollout_actions(node, *policy_, rng_, depth, horizon);

    // (4) Backpropagate
    if (config_.verbose)
        std::cerr << "[mcts]   rollout ended in "
                  << tree.node(rollout.node).state << " at depth "
                  << rollout.depth << " with "
                  << (tree.node(rollout.node).is_goal ? "success"
                                                      : "no success")
                  << "\n";
    tree.update(rollout.node, config_.discounting);
}

SearchResult Mcts::search(SearchTree& tree, const Budget& budget)
{
    SearchResult result;
    while (budget(result.iterations))
    {
        iterate(tree, result.iterations);
        ++result.iterations;
    }

    result.actions = tree.root_statistics();
    result.tree_size = tree.size();
    for (const auto& stats : result.actions)
    {
        if (stats.visits > 0)
        {
            result.success = true;
            break;
        }
    }
    if (result.success)
        result.action = policy_->select_best(result.actions);

    if (config_.verbose)
    {
        std::cerr << "[mcts] search completed after " << result.iterations
                  << " iterations, " << result.tree_size << " nodes";
        if (result.success)
            std::cerr << ", best action "
                      << tree.get_problem().get_action(result.action).get_name();
        std::cerr << "\n";
    }
    return result;
}

SearchResult Mcts::search(const Problem& problem,
                          const WorldState& root_state,
                          const Budget& budget)
{
    SearchTree tree(problem, root_state);
    return search(tree, budget);
}

} // namespace pdo::search

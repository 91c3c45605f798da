#include "Policy.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <random>

namespace pdo::search
{

// ── Internal helpers ─────────────────────────────────────────────────

static ActionId pick_uniform(const std::vector<ActionId>& candidates,
                             RandomEngine& rng,
                             const char* what)
{
    if (candidates.empty())
        throw NoApplicableAction(fmt::format("no {} action to choose from", what));
    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(rng)];
}

double ucb1_score(const ActionStats& stats, size_t node_visits, double exploration)
{
    if (stats.visits == 0)
        return std::numeric_limits<double>::infinity();
    const double n = static_cast<double>(stats.visits);
    const double total = static_cast<double>(std::max<size_t>(node_visits, 1));
    return exploration * std::sqrt(std::log(total) / n) + stats.reward / n;
}

// ── DefaultPolicy methods ────────────────────────────────────────────

DefaultPolicy::DefaultPolicy(double exploration) : exploration_(exploration) {}

double DefaultPolicy::get_exploration() const
{
    return exploration_;
}

ActionId DefaultPolicy::select_action(const SearchTree& tree,
                                      NodeId node,
                                      [[maybe_unused]] RandomEngine& rng) const
{
    const SearchNode& n = tree.node(node);
    if (n.tried_actions.empty())
        throw NoApplicableAction("no tried action to select from");

    const ActionStats* best = nullptr;
    double best_score = 0.0;
    for (const auto& stats : n.tried_actions)
    {
        double score = ucb1_score(stats, n.visits, exploration_);
        if (best == nullptr || score > best_score)
        {
            best = &stats;
            best_score = score;
        }
    }
    return best->action;
}

ActionId DefaultPolicy::expand_action(const SearchTree& tree,
                                      NodeId node,
                                      RandomEngine& rng) const
{
    return pick_uniform(tree.node(node).untried_actions, rng, "untried");
}

ActionId DefaultPolicy::rollout_action(const SearchTree& tree,
                                       NodeId node,
                                       RandomEngine& rng) const
{
    return pick_uniform(tree.node(node).applicable_actions, rng, "applicable");
}

ActionId DefaultPolicy::select_best(const std::vector<ActionStats>& actions) const
{
    const ActionStats* best = nullptr;
    double best_average = 0.0;
    for (const auto& stats : actions)
    {
        if (stats.visits == 0)
            continue;
        double average = stats.reward / static_cast<double>(stats.visits);
        if (best == nullptr || average > best_average)
        {
            best = &stats;
            best_average = average;
        }
    }
    if (best == nullptr)
        throw NoApplicableAction("no visited root action to choose from");
    return best->action;
}

} // namespace pdo::search

#include "SearchTree.hpp"
#include "Policy.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace pdo::search
{

// ── SearchNode methods ───────────────────────────────────────────────

bool SearchNode::is_root() const
{
    return parent == NO_NODE;
}

bool SearchNode::is_terminal() const
{
    return is_goal || applicable_actions.empty();
}

const ActionStats* SearchNode::find_tried(ActionId action) const
{
    for (const auto& stats : tried_actions)
    {
        if (stats.action == action)
            return &stats;
    }
    return nullptr;
}

ActionStats* SearchNode::find_tried(ActionId action)
{
    for (auto& stats : tried_actions)
    {
        if (stats.action == action)
            return &stats;
    }
    return nullptr;
}

// ── SearchTree methods ───────────────────────────────────────────────

SearchTree::SearchTree(const Problem& problem, WorldState root_state)
    : problem_(&problem)
{
    add_node(NO_NODE, {}, std::move(root_state));
}

const Problem& SearchTree::get_problem() const
{
    return *problem_;
}

NodeId SearchTree::root() const
{
    return 0;
}

const SearchNode& SearchTree::node(NodeId id) const
{
    return nodes_.at(id);
}

size_t SearchTree::size() const
{
    return nodes_.size();
}

NodeId SearchTree::add_node(NodeId parent, ChildKey edge, WorldState state)
{
    SearchNode n;
    n.parent = parent;
    n.edge = edge;
    n.is_goal = problem_->is_goal_reached(state);
    n.applicable_actions = problem_->applicable_actions(state);
    n.untried_actions = n.applicable_actions;
    n.state = std::move(state);
    nodes_.push_back(std::move(n));
    return nodes_.size() - 1;
}

NodeId SearchTree::simulate_action(NodeId id,
                                   ActionId action,
                                   RandomEngine& rng,
                                   bool most_probable)
{
    const Action& a = problem_->get_action(action);
    const EffectId effect =
        most_probable ? a.most_probable_outcome() : a.outcome(rng);
    const ChildKey key{ action, effect };

    auto it = nodes_.at(id).children.find(key);
    if (it != nodes_[id].children.end())
        return it->second;

    WorldState next = nodes_[id].state.apply(a.get_effect(effect));
    NodeId child = add_node(id, key, std::move(next));
    nodes_[id].children.emplace(key, child);
    return child;
}

NodeId SearchTree::perform_action(NodeId id, ActionId action, RandomEngine& rng)
{
    auto& untried = nodes_.at(id).untried_actions;
    auto it = std::find(untried.begin(), untried.end(), action);
    if (it == untried.end())
        throw IllegalAction(fmt::format(
            "action '{}' is not an untried action of state {}",
            problem_->get_action(action).get_name(),
            to_string(nodes_[id].state)));

    untried.erase(it);
    nodes_[id].tried_actions.push_back({ action, 0.0, 0 });
    return simulate_action(id, action, rng);
}

RolloutResult SearchTree::rollout_actions(NodeId id,
                                          const SearchPolicy& policy,
                                          RandomEngine& rng,
                                          size_t depth,
                                          size_t horizon)
{
    while (depth < horizon && !nodes_.at(id).is_terminal())
    {
        ActionId action = policy.rollout_action(*this, id, rng);
        id = simulate_action(id, action, rng, true);
        ++depth;
    }
    return { id, depth };
}

void SearchTree::update(NodeId id, double discounting)
{
    double reward = 0.0;
    for (NodeId current = id; current != NO_NODE;
         current = nodes_[current].parent)
    {
        SearchNode& n = nodes_.at(current);
        reward *= discounting;
        if (n.is_goal)
            reward += problem_->get_goal_reward();
        if (!n.is_root())
        {
            const Action& a = problem_->get_action(n.edge.first);
            reward += a.get_effect(n.edge.second).get_reward();
        }

        // Rollout-only transitions are passed through untouched
        if (!n.is_root())
        {
            ActionStats* stats = nodes_[n.parent].find_tried(n.edge.first);
            if (stats == nullptr)
                continue;
            stats->reward += reward;
            ++stats->visits;
        }
        n.utility += reward;
        ++n.visits;
    }
}

const std::vector<ActionStats>& SearchTree::root_statistics() const
{
    return nodes_.front().tried_actions;
}

} // namespace pdo::search

/// @file Episode.hpp
/// Control loop acting in a (simulated) world until the goal is reached.
#pragma once
#include "Mcts.hpp"
#include <functional>
#include <vector>

namespace pdo::search
{

/// One real step taken during an episode.
struct EpisodeStep
{
    WorldState state; ///< State in which the action was chosen.
    ActionId action;  ///< Action chosen by the search.
    EffectId effect;  ///< Outcome that actually occurred.
};

/// Outcome of an episode.
struct EpisodeResult
{
    bool goal_reached = false;
    std::vector<EpisodeStep> steps;
    WorldState final_state;
    double total_reward = 0.0; ///< Effect rewards plus the goal reward.
};

/// Called after each search with the tree it built and the step index.
using SearchObserver = std::function<void(const SearchTree&, size_t step)>;

/// Search, act, and repeat from the problem's initial state.
///
/// Each chosen action is executed by sampling its real outcome with the
/// driver's random engine. Stops when a goal state is reached or after
/// @p max_steps actions.
/// @throws NoApplicableAction if a non-goal state offers no action.
/// @throws Error if @p budget stops a search before its first iteration.
EpisodeResult run_episode(Mcts& mcts,
                          const Problem& problem,
                          const Budget& budget,
                          size_t max_steps,
                          const SearchObserver& observer = nullptr);

} // namespace pdo::search

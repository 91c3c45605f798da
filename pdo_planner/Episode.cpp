#include "Episode.hpp"
#include <fmt/format.h>
#include <iostream>

namespace pdo::search
{

EpisodeResult run_episode(Mcts& mcts,
                          const Problem& problem,
                          const Budget& budget,
                          size_t max_steps,
                          const SearchObserver& observer)
{
    const bool verbose = mcts.get_config().verbose;
    EpisodeResult result;
    WorldState state = problem.get_init();

    while (!problem.is_goal_reached(state) && result.steps.size() < max_steps)
    {
        SearchTree tree(problem, state);
        if (tree.node(tree.root()).applicable_actions.empty())
            throw NoApplicableAction(fmt::format(
                "no applicable action in non-goal state {}", to_string(state)));
        SearchResult search = mcts.search(tree, budget);
        if (observer)
            observer(tree, result.steps.size());
        if (!search.success)
            throw Error("the search budget allowed no iteration");

        const Action& action = problem.get_action(search.action);
        const EffectId effect = action.outcome(mcts.get_rng());
        result.steps.push_back({ state, search.action, effect });
        result.total_reward += action.get_effect(effect).get_reward();
        state = state.apply(action.get_effect(effect));

        if (verbose)
            std::cerr << "[episode] step " << result.steps.size() << ": "
                      << action.get_name() << " -> " << state << "\n";
    }

    result.goal_reached = problem.is_goal_reached(state);
    if (result.goal_reached)
        result.total_reward += problem.get_goal_reward();
    result.final_state = std::move(state);
    return result;
}

} // namespace pdo::search

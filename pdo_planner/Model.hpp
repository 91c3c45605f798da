/// @file Model.hpp
/// Probabilistic planning model: world states, effects, actions, problems.
///
/// All types are immutable once constructed and validate their invariants in
/// their constructor, so a malformed domain is rejected before any search.
#pragma once
#include "Vose.hpp"
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pdo::search
{

/// Opaque proposition identifier.
using Atom = std::string;

/// Ordered set of atoms (ordering only matters for printing).
using AtomSet = std::set<Atom>;

/// Index of an effect inside its Action.
using EffectId = size_t;

/// Index of an action inside its Problem.
using ActionId = size_t;

/// Source of uniform random draws shared by the sampler and the policies.
using RandomEngine = std::mt19937_64;

/// Tolerance used when checking that effect probabilities sum to 1.
constexpr double PROBABILITY_EPSILON = 1e-9;

/// A conjunction of literals: all of @c positive must hold and none of
/// @c negative. Preconditions and goals are disjunctions of Conditions.
struct Condition
{
    AtomSet negative; ///< Atoms that must be false.
    AtomSet positive; ///< Atoms that must be true.
};

class Effect;

/// Closed-world state: the set of atoms currently true.
class WorldState
{
public:

    WorldState() = default;
    explicit WorldState(AtomSet atoms);
    WorldState(std::initializer_list<Atom> atoms);

    /// Check whether an atom is currently true.
    bool holds(const Atom& atom) const;

    /// Check a single conjunctive condition: pos ⊆ S and neg ∩ S = ∅.
    bool satisfies(const Condition& condition) const;

    /// Check a disjunction of conditions (false when @p conditions is empty).
    bool satisfies_any(const std::vector<Condition>& conditions) const;

    /// Derive the successor state (S \ delete) ∪ add.
    WorldState apply(const Effect& effect) const;

    /// Read-only access to the true atoms.
    const AtomSet& get_atoms() const;

    bool operator==(const WorldState& other) const = default;

private:

    AtomSet atoms_;
};

/// One stochastic outcome of an action.
class Effect
{
public:

    /// @throws InvalidEffectProbabilities if @p probability is outside
    ///         [0, 1].
    /// @throws Error if @p reward is not finite.
    Effect(AtomSet delete_set,
           AtomSet add_set,
           double probability,
           double reward = 0.0);

    const AtomSet& get_delete_set() const;
    const AtomSet& get_add_set() const;
    double get_probability() const;
    double get_reward() const;

    /// True for the effect that changes nothing and gives no reward.
    bool is_noop() const;

private:

    AtomSet delete_;
    AtomSet add_;
    double probability_;
    double reward_;
};

/// An action: disjunctive preconditions and a complete effect distribution.
class Action
{
public:

    /// Build the action and its outcome sampler.
    ///
    /// When the effect probabilities sum to less than 1, a no-op effect
    /// holding the remaining mass is added. Effects are then ordered most
    /// probable first (ties keep their declaration order).
    /// @param preconditions  Disjunction of conditions; empty means the
    ///                       action is always applicable.
    /// @throws InvalidEffectProbabilities if the effects sum above 1.
    Action(std::string name,
           std::vector<Condition> preconditions,
           std::vector<Effect> effects);

    const std::string& get_name() const;
    const std::vector<Condition>& get_preconditions() const;
    const std::vector<Effect>& get_effects() const;
    const Effect& get_effect(EffectId id) const;

    /// Check whether at least one precondition holds in @p state.
    bool is_applicable(const WorldState& state) const;

    /// Draw an effect according to the effect distribution, in O(1).
    EffectId outcome(RandomEngine& rng) const;

    /// The highest-probability effect, without sampling.
    EffectId most_probable_outcome() const;

private:

    std::string name_;
    std::vector<Condition> preconditions_;
    std::vector<Effect> effects_;
    Vose<EffectId> sampler_;
};

/// A planning problem: initial state, disjunctive goal and actions.
class Problem
{
public:

    /// @throws Error if @p goal_reward is not finite.
    Problem(std::string name,
            WorldState init,
            std::vector<Condition> goals,
            double goal_reward,
            std::vector<Action> actions);

    const std::string& get_name() const;
    const WorldState& get_init() const;
    const std::vector<Condition>& get_goals() const;
    double get_goal_reward() const;
    const std::vector<Action>& get_actions() const;
    const Action& get_action(ActionId id) const;

    /// Check whether @p state satisfies at least one goal condition.
    bool is_goal_reached(const WorldState& state) const;

    /// Actions applicable in @p state, in declaration order.
    std::vector<ActionId> applicable_actions(const WorldState& state) const;

    /// Look an action up by name.
    std::optional<ActionId> find_action(std::string_view name) const;

private:

    std::string name_;
    WorldState init_;
    std::vector<Condition> goals_;
    double goal_reward_;
    std::vector<Action> actions_;
};

/// Print a state as its sorted atoms, e.g. @c {guns, riches}.
std::ostream& operator<<(std::ostream& os, const WorldState& state);

/// Print a condition as its literals, e.g. @c house, -guns.
std::ostream& operator<<(std::ostream& os, const Condition& condition);

/// Print an effect as @c 0.90  house, -riches  (+0.00).
std::ostream& operator<<(std::ostream& os, const Effect& effect);

/// Print an action with its preconditions and effects.
std::ostream& operator<<(std::ostream& os, const Action& action);

/// Print the full problem description.
std::ostream& operator<<(std::ostream& os, const Problem& problem);

/// Render a state as a string (same format as operator<<).
std::string to_string(const WorldState& state);

/// Render an effect as a string (same format as operator<<).
std::string to_string(const Effect& effect);

} // namespace pdo::search

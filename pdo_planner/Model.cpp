#include "Model.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <sstream>
#include <ostream>

namespace pdo::search
{

// ── Internal helpers ─────────────────────────────────────────────────

static std::vector<Effect> complete_distribution(const std::string& name,
                                                 std::vector<Effect> effects)
{
    double total = 0.0;
    for (const auto& e : effects)
        total += e.get_probability();

    if (total > 1.0 + PROBABILITY_EPSILON)
        throw InvalidEffectProbabilities(fmt::format(
            "action '{}': effect probabilities sum to {} (more than 1)",
            name,
            total));

    if (total < 1.0 - PROBABILITY_EPSILON)
        effects.emplace_back(AtomSet{}, AtomSet{}, 1.0 - total);

    std::stable_sort(effects.begin(),
                     effects.end(),
                     [](const Effect& a, const Effect& b)
                     { return a.get_probability() > b.get_probability(); });
    return effects;
}

static std::vector<Vose<EffectId>::Element>
sampler_elements(const std::vector<Effect>& effects)
{
    std::vector<Vose<EffectId>::Element> elements;
    elements.reserve(effects.size());
    for (EffectId i = 0; i < effects.size(); ++i)
        elements.emplace_back(effects[i].get_probability(), i);
    return elements;
}

static void print_literals(std::ostream& os,
                           const AtomSet& positive,
                           const AtomSet& negative)
{
    bool first = true;
    for (const auto& atom : positive)
    {
        os << (first ? "" : ", ") << atom;
        first = false;
    }
    for (const auto& atom : negative)
    {
        os << (first ? "-" : ", -") << atom;
        first = false;
    }
}

// ── WorldState methods ───────────────────────────────────────────────

WorldState::WorldState(AtomSet atoms) : atoms_(std::move(atoms)) {}

WorldState::WorldState(std::initializer_list<Atom> atoms) : atoms_(atoms) {}

bool WorldState::holds(const Atom& atom) const
{
    return atoms_.count(atom) != 0;
}

bool WorldState::satisfies(const Condition& condition) const
{
    for (const auto& atom : condition.positive)
    {
        if (!holds(atom))
            return false;
    }
    for (const auto& atom : condition.negative)
    {
        if (holds(atom))
            return false;
    }
    return true;
}

bool WorldState::satisfies_any(const std::vector<Condition>& conditions) const
{
    return std::any_of(conditions.begin(),
                       conditions.end(),
                       [this](const Condition& c) { return satisfies(c); });
}

WorldState WorldState::apply(const Effect& effect) const
{
    WorldState next(*this);
    for (const auto& atom : effect.get_delete_set())
        next.atoms_.erase(atom);
    for (const auto& atom : effect.get_add_set())
        next.atoms_.insert(atom);
    return next;
}

const AtomSet& WorldState::get_atoms() const
{
    return atoms_;
}

// ── Effect methods ───────────────────────────────────────────────────

Effect::Effect(AtomSet delete_set,
               AtomSet add_set,
               double probability,
               double reward)
    : delete_(std::move(delete_set)),
      add_(std::move(add_set)),
      probability_(probability),
      reward_(reward)
{
    if (!(probability >= 0.0 && probability <= 1.0))
        throw InvalidEffectProbabilities(fmt::format(
            "effect probability must lie in [0, 1], got {}", probability));
    if (!std::isfinite(reward))
        throw Error(fmt::format("effect reward must be finite, got {}", reward));
}

const AtomSet& Effect::get_delete_set() const
{
    return delete_;
}

const AtomSet& Effect::get_add_set() const
{
    return add_;
}

double Effect::get_probability() const
{
    return probability_;
}

double Effect::get_reward() const
{
    return reward_;
}

bool Effect::is_noop() const
{
    return delete_.empty() && add_.empty() && reward_ == 0.0;
}

// ── Action methods ───────────────────────────────────────────────────

Action::Action(std::string name,
               std::vector<Condition> preconditions,
               std::vector<Effect> effects)
    : name_(std::move(name)),
      preconditions_(std::move(preconditions)),
      effects_(complete_distribution(name_, std::move(effects))),
      sampler_(sampler_elements(effects_))
{
}

const std::string& Action::get_name() const
{
    return name_;
}

const std::vector<Condition>& Action::get_preconditions() const
{
    return preconditions_;
}

const std::vector<Effect>& Action::get_effects() const
{
    return effects_;
}

const Effect& Action::get_effect(EffectId id) const
{
    return effects_.at(id);
}

bool Action::is_applicable(const WorldState& state) const
{
    return preconditions_.empty() || state.satisfies_any(preconditions_);
}

EffectId Action::outcome(RandomEngine& rng) const
{
    return sampler_.random(rng);
}

EffectId Action::most_probable_outcome() const
{
    return 0;
}

// ── Problem methods ──────────────────────────────────────────────────

Problem::Problem(std::string name,
                 WorldState init,
                 std::vector<Condition> goals,
                 double goal_reward,
                 std::vector<Action> actions)
    : name_(std::move(name)),
      init_(std::move(init)),
      goals_(std::move(goals)),
      goal_reward_(goal_reward),
      actions_(std::move(actions))
{
    if (!std::isfinite(goal_reward))
        throw Error(fmt::format("problem '{}': goal reward must be finite",
                                name_));
}

const std::string& Problem::get_name() const
{
    return name_;
}

const WorldState& Problem::get_init() const
{
    return init_;
}

const std::vector<Condition>& Problem::get_goals() const
{
    return goals_;
}

double Problem::get_goal_reward() const
{
    return goal_reward_;
}

const std::vector<Action>& Problem::get_actions() const
{
    return actions_;
}

const Action& Problem::get_action(ActionId id) const
{
    return actions_.at(id);
}

bool Problem::is_goal_reached(const WorldState& state) const
{
    return state.satisfies_any(goals_);
}

std::vector<ActionId> Problem::applicable_actions(const WorldState& state) const
{
    std::vector<ActionId> result;
    for (ActionId id = 0; id < actions_.size(); ++id)
    {
        if (actions_[id].is_applicable(state))
            result.push_back(id);
    }
    return result;
}

std::optional<ActionId> Problem::find_action(std::string_view name) const
{
    for (ActionId id = 0; id < actions_.size(); ++id)
    {
        if (actions_[id].get_name() == name)
            return id;
    }
    return std::nullopt;
}

// ── Printing ─────────────────────────────────────────────────────────

std::ostream& operator<<(std::ostream& os, const WorldState& state)
{
    os << "{";
    bool first = true;
    for (const auto& atom : state.get_atoms())
    {
        os << (first ? "" : ", ") << atom;
        first = false;
    }
    return os << "}";
}

std::ostream& operator<<(std::ostream& os, const Condition& condition)
{
    print_literals(os, condition.positive, condition.negative);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Effect& effect)
{
    os << fmt::format("{:.2f}  ", effect.get_probability());
    if (!effect.get_add_set().empty() || !effect.get_delete_set().empty())
    {
        print_literals(os, effect.get_add_set(), effect.get_delete_set());
        os << "  ";
    }
    return os << fmt::format("({:+.2f})", effect.get_reward());
}

std::ostream& operator<<(std::ostream& os, const Action& action)
{
    os << "name: " << action.get_name() << "\n";
    os << "  preconditions:\n";
    for (const auto& condition : action.get_preconditions())
        os << "    -> " << condition << "\n";
    if (action.get_preconditions().empty())
        os << "    (none)\n";
    os << "  effects:\n";
    for (const auto& effect : action.get_effects())
        os << "    " << effect << "\n";
    return os;
}

std::ostream& operator<<(std::ostream& os, const Problem& problem)
{
    os << "Problem description of " << problem.get_name() << ":\n";
    os << " init conditions:\n  " << problem.get_init() << "\n";
    os << " goal conditions:\n";
    for (const auto& goal : problem.get_goals())
        os << "  -> " << goal << "\n";
    os << " goal reward: " << problem.get_goal_reward() << "\n";
    os << " " << problem.get_actions().size() << " actions:\n";
    for (const auto& action : problem.get_actions())
        os << "  " << action;
    return os;
}

std::string to_string(const WorldState& state)
{
    std::ostringstream ss;
    ss << state;
    return ss.str();
}

std::string to_string(const Effect& effect)
{
    std::ostringstream ss;
    ss << effect;
    return ss.str();
}

} // namespace pdo::search

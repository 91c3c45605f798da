#include "TestProblems.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <sstream>

using namespace pdo::search;
using pdo::Error;
using pdo::InvalidEffectProbabilities;

namespace
{

Action make_action(std::vector<Effect> effects,
                   std::vector<Condition> preconditions = {})
{
    return Action("act", std::move(preconditions), std::move(effects));
}

double total_probability(const Action& action)
{
    double total = 0.0;
    for (const auto& e : action.get_effects())
        total += e.get_probability();
    return total;
}

} // namespace

// ── WorldState ───────────────────────────────────────────────────────

TEST(WorldState, ApplyDeletesThenAdds)
{
    WorldState s{ "a", "b" };
    Effect e({ "a", "b" }, { "b", "c" }, 1.0);
    WorldState next = s.apply(e);

    EXPECT_EQ(next, (WorldState{ "b", "c" }));
    EXPECT_TRUE(next.holds("b"));
    EXPECT_FALSE(next.holds("a"));
    // The source state is left untouched
    EXPECT_EQ(s, (WorldState{ "a", "b" }));
}

TEST(WorldState, SatisfiesConjunction)
{
    WorldState s{ "guns", "riches" };
    EXPECT_TRUE(s.satisfies({ {}, { "guns", "riches" } }));
    EXPECT_TRUE(s.satisfies({ { "house" }, { "guns" } }));
    EXPECT_FALSE(s.satisfies({ { "guns" }, {} }));
    EXPECT_FALSE(s.satisfies({ {}, { "yacht" } }));
    EXPECT_TRUE(s.satisfies(Condition{}));
}

TEST(WorldState, SatisfiesAnyIsADisjunction)
{
    WorldState s{ "house" };
    std::vector<Condition> goals = { { {}, { "yacht" } }, { {}, { "house" } } };
    EXPECT_TRUE(s.satisfies_any(goals));
    EXPECT_FALSE(s.satisfies_any({ { {}, { "yacht" } } }));
    EXPECT_FALSE(s.satisfies_any({}));
}

// ── Effect ───────────────────────────────────────────────────────────

TEST(Effect, RejectsProbabilityOutsideUnitInterval)
{
    EXPECT_THROW(Effect({}, { "a" }, 1.5), InvalidEffectProbabilities);
    EXPECT_THROW(Effect({}, { "a" }, -0.1), InvalidEffectProbabilities);
    EXPECT_NO_THROW(Effect({}, { "a" }, 0.0));
    EXPECT_NO_THROW(Effect({}, { "a" }, 1.0));
}

TEST(Effect, RejectsNonFiniteReward)
{
    EXPECT_THROW(Effect({}, {}, 0.5, std::nan("")), Error);
}

TEST(Effect, NoopHasNeitherAtomsNorReward)
{
    EXPECT_TRUE(Effect({}, {}, 0.2).is_noop());
    EXPECT_FALSE(Effect({}, {}, 0.2, -0.6).is_noop());
    EXPECT_FALSE(Effect({ "a" }, {}, 0.2).is_noop());
}

// ── Action ───────────────────────────────────────────────────────────

TEST(Action, MissingMassBecomesNoop)
{
    Action a = make_action({ Effect({}, { "x" }, 0.5), Effect({}, { "y" }, 0.3) });

    ASSERT_EQ(a.get_effects().size(), 3u);
    EXPECT_DOUBLE_EQ(a.get_effect(0).get_probability(), 0.5);
    EXPECT_DOUBLE_EQ(a.get_effect(1).get_probability(), 0.3);
    EXPECT_NEAR(a.get_effect(2).get_probability(), 0.2, 1e-12);
    EXPECT_TRUE(a.get_effect(2).is_noop());
    EXPECT_NEAR(total_probability(a), 1.0, 1e-12);
}

TEST(Action, EffectsAreSortedMostProbableFirst)
{
    Action a = make_action({ Effect({}, { "x" }, 0.1),
                             Effect({}, { "y" }, 0.6),
                             Effect({}, { "z" }, 0.3) });

    ASSERT_EQ(a.get_effects().size(), 3u);
    EXPECT_TRUE(a.get_effect(0).get_add_set().count("y"));
    EXPECT_TRUE(a.get_effect(1).get_add_set().count("z"));
    EXPECT_TRUE(a.get_effect(2).get_add_set().count("x"));
    EXPECT_EQ(a.most_probable_outcome(), 0u);
}

TEST(Action, NoopCanBeTheMostProbableEffect)
{
    Action a = make_action({ Effect({}, { "x" }, 0.25) });
    ASSERT_EQ(a.get_effects().size(), 2u);
    EXPECT_TRUE(a.get_effect(a.most_probable_outcome()).is_noop());
    EXPECT_DOUBLE_EQ(a.get_effect(0).get_probability(), 0.75);
}

TEST(Action, CompleteDistributionGetsNoNoop)
{
    Action a = make_action({ Effect({}, { "x" }, 0.7), Effect({}, { "y" }, 0.3) });
    EXPECT_EQ(a.get_effects().size(), 2u);
}

TEST(Action, NoEffectsGivesSingleNoop)
{
    Action a = make_action({});
    ASSERT_EQ(a.get_effects().size(), 1u);
    EXPECT_TRUE(a.get_effect(0).is_noop());
    EXPECT_DOUBLE_EQ(a.get_effect(0).get_probability(), 1.0);
}

TEST(Action, RejectsProbabilitiesAboveOne)
{
    EXPECT_THROW(make_action({ Effect({}, { "x" }, 0.7), Effect({}, { "y" }, 0.4) }),
                 InvalidEffectProbabilities);
}

TEST(Action, EmptyPreconditionsAlwaysApply)
{
    Action a = make_action({ Effect({}, { "x" }, 1.0) });
    EXPECT_TRUE(a.is_applicable(WorldState{}));
    EXPECT_TRUE(a.is_applicable(WorldState{ "anything" }));
}

TEST(Action, DisjunctivePreconditions)
{
    Action a = make_action({ Effect({}, { "x" }, 1.0) },
                           { { {}, { "a" } }, { { "b" }, { "c" } } });
    EXPECT_TRUE(a.is_applicable(WorldState{ "a" }));
    EXPECT_TRUE(a.is_applicable(WorldState{ "c" }));
    EXPECT_FALSE(a.is_applicable(WorldState{ "b", "c" }));
    EXPECT_FALSE(a.is_applicable(WorldState{}));
}

TEST(Action, OutcomeFollowsTheDistribution)
{
    Action a = make_action({ Effect({}, { "likely" }, 0.9),
                             Effect({}, { "rare" }, 0.1) });
    RandomEngine rng(11);
    const int draws = 100000;
    int likely = 0;
    for (int i = 0; i < draws; ++i)
    {
        EffectId id = a.outcome(rng);
        ASSERT_LT(id, a.get_effects().size());
        if (a.get_effect(id).get_add_set().count("likely"))
            ++likely;
    }
    EXPECT_NEAR(double(likely) / draws, 0.9, 0.01);
}

TEST(Action, ZeroProbabilityEffectIsNeverSampled)
{
    Action a = make_action({ Effect({}, { "never" }, 0.0), Effect({}, { "always" }, 1.0) });
    ASSERT_EQ(a.get_effects().size(), 2u);
    EXPECT_TRUE(a.get_effect(1).get_add_set().count("never"));

    RandomEngine rng(5);
    for (int i = 0; i < 10000; ++i)
        EXPECT_EQ(a.outcome(rng), 0u);
}

TEST(Action, GetEffectChecksBounds)
{
    Action a = make_action({ Effect({}, { "x" }, 1.0) });
    EXPECT_THROW(a.get_effect(5), std::out_of_range);
}

// ── Problem ──────────────────────────────────────────────────────────

TEST(Problem, GoalIsReachedWhenAnyConditionHolds)
{
    Problem p = pdo::test::make_maffia_problem();
    EXPECT_FALSE(p.is_goal_reached(p.get_init()));
    EXPECT_TRUE(p.is_goal_reached(WorldState{ "house", "yacht" }));
    EXPECT_FALSE(p.is_goal_reached(WorldState{ "house", "yacht", "guns" }));
}

TEST(Problem, ApplicableActionsKeepDeclarationOrder)
{
    Problem p = pdo::test::make_maffia_problem();
    std::vector<ActionId> ids = p.applicable_actions(p.get_init());

    std::vector<std::string> names;
    for (ActionId id : ids)
        names.push_back(p.get_action(id).get_name());
    EXPECT_EQ(names, (std::vector<std::string>{ "traffic", "raid", "beg" }));
}

TEST(Problem, FindActionByName)
{
    Problem p = pdo::test::make_maffia_problem();
    ASSERT_TRUE(p.find_action("dump").has_value());
    EXPECT_EQ(p.get_action(*p.find_action("dump")).get_name(), "dump");
    EXPECT_FALSE(p.find_action("steal").has_value());
}

TEST(Problem, RejectsNonFiniteGoalReward)
{
    EXPECT_THROW(Problem("p", WorldState{}, {}, INFINITY, {}), Error);
}

// ── Printing ─────────────────────────────────────────────────────────

TEST(Printing, StateListsSortedAtoms)
{
    EXPECT_EQ(to_string(WorldState{ "riches", "guns" }), "{guns, riches}");
    EXPECT_EQ(to_string(WorldState{}), "{}");
}

TEST(Printing, EffectShowsProbabilityLiteralsAndReward)
{
    EXPECT_EQ(to_string(Effect({ "riches" }, { "house" }, 0.9)),
              "0.90  house, -riches  (+0.00)");
    EXPECT_EQ(to_string(Effect({}, {}, 0.2, -0.6)), "0.20  (-0.60)");
}

TEST(Printing, ProblemDescription)
{
    std::ostringstream ss;
    ss << pdo::test::make_riches_problem();
    const std::string text = ss.str();
    EXPECT_NE(text.find("Problem description of riches"), std::string::npos);
    EXPECT_NE(text.find("name: traffic"), std::string::npos);
    EXPECT_NE(text.find("-> riches"), std::string::npos);
}

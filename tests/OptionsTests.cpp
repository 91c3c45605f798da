#include "Options.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using pdo::Options;

namespace
{

Options parse(std::vector<const char*> args)
{
    args.insert(args.begin(), "pdo-plan");
    return pdo::parse_options(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(Options, Defaults)
{
    Options options = parse({ "-p", "maffia.pdo" });
    EXPECT_EQ(options.problem_path, "maffia.pdo");
    EXPECT_TRUE(options.dot_path.empty());
    EXPECT_EQ(options.iterations, 1000u);
    EXPECT_EQ(options.seconds, 0.0);
    EXPECT_EQ(options.max_steps, 100u);
    EXPECT_EQ(options.config.horizon, 50u);
    EXPECT_FALSE(options.config.seed.has_value());
    EXPECT_FALSE(options.config.verbose);
    EXPECT_FALSE(options.help);
}

TEST(Options, EveryOption)
{
    Options options = parse({ "-p", "a.pdo", "-i", "200", "-t", "0.5", "-H", "7",
                              "-g", "0.95", "-s", "42", "-n", "0", "-o",
                              "tree.dot", "-v" });
    EXPECT_EQ(options.iterations, 200u);
    EXPECT_DOUBLE_EQ(options.seconds, 0.5);
    EXPECT_EQ(options.config.horizon, 7u);
    EXPECT_DOUBLE_EQ(options.config.discounting, 0.95);
    ASSERT_TRUE(options.config.seed.has_value());
    EXPECT_EQ(*options.config.seed, 42u);
    EXPECT_EQ(options.max_steps, 0u);
    EXPECT_EQ(options.dot_path, "tree.dot");
    EXPECT_TRUE(options.config.verbose);
}

TEST(Options, HelpNeedsNoProblem)
{
    EXPECT_TRUE(parse({ "-h" }).help);
    EXPECT_TRUE(parse({ "--help" }).help);
}

TEST(Options, RejectsNegativeCounts)
{
    EXPECT_THROW(parse({ "-p", "a.pdo", "-i", "-1" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-p", "a.pdo", "-H", "-1" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-p", "a.pdo", "-n", "-1" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-p", "a.pdo", "-s", "-3" }), std::invalid_argument);
}

TEST(Options, RejectsZeroIterationsAndHorizon)
{
    EXPECT_THROW(parse({ "-p", "a.pdo", "-i", "0" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-p", "a.pdo", "-H", "0" }), std::invalid_argument);
}

TEST(Options, RejectsMalformedNumbers)
{
    EXPECT_THROW(parse({ "-p", "a.pdo", "-i", "10x" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-p", "a.pdo", "-i", " 10" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-p", "a.pdo", "-i", "99999999999999999999999" }),
                 std::invalid_argument);
    EXPECT_THROW(parse({ "-p", "a.pdo", "-g", "fast" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-p", "a.pdo", "-g", "nan" }), std::invalid_argument);
}

TEST(Options, RejectsNonPositiveTime)
{
    EXPECT_THROW(parse({ "-p", "a.pdo", "-t", "-5" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-p", "a.pdo", "-t", "0" }), std::invalid_argument);
}

TEST(Options, RejectsUnknownOrIncompleteOptions)
{
    EXPECT_THROW(parse({ "-p", "a.pdo", "-x", "1" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-p", "a.pdo", "-i" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-i", "10" }), std::invalid_argument);
}

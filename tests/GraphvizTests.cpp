#include "Graphviz.hpp"
#include "TestProblems.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace pdo::search;

namespace
{

bool contains(const std::string& text, const std::string& part)
{
    return text.find(part) != std::string::npos;
}

} // namespace

TEST(Graphviz, ExportsTriedActionsAndOutcomes)
{
    Problem p = pdo::test::make_riches_problem();
    SearchTree tree(p, p.get_init());
    RandomEngine rng(1);

    NodeId child = tree.perform_action(tree.root(), 0, rng);
    tree.update(child, 0.9);

    const std::string dot = to_graphviz(tree);
    EXPECT_EQ(dot.rfind("graph search_tree {\n", 0), 0u);
    EXPECT_EQ(dot.substr(dot.size() - 2), "}\n");
    EXPECT_TRUE(contains(dot, "decision_node0 [label=\"riches\\n"));
    EXPECT_TRUE(contains(dot, "action_node0_0 [label=\"traffic\", shape=box]"));
    EXPECT_TRUE(contains(dot, "action_node0_0 -- decision_node0_0 [style=dashed"));
    EXPECT_TRUE(contains(dot, "decision_node0 -- action_node0_0 [label=\""));
    EXPECT_TRUE(contains(dot, "penwidth=\"1.000\""));
}

TEST(Graphviz, SimulatedChildrenAreHidden)
{
    Problem p = pdo::test::make_chain_problem();
    SearchTree tree(p, p.get_init());
    RandomEngine rng(1);

    tree.simulate_action(tree.root(), 0, rng);
    ASSERT_EQ(tree.size(), 2u);

    const std::string dot = to_graphviz(tree);
    EXPECT_FALSE(contains(dot, "--"));
    EXPECT_FALSE(contains(dot, "decision_node0_0"));
    EXPECT_TRUE(contains(dot, "decision_node0 [label=\"\\n0.00,0\"]"));
}

TEST(Graphviz, ExportsFromAnyNode)
{
    Problem p = pdo::test::make_chain_problem();
    SearchTree tree(p, p.get_init());
    RandomEngine rng(1);

    NodeId n1 = tree.perform_action(tree.root(), 0, rng);
    const std::string dot = to_graphviz(tree, n1);
    EXPECT_TRUE(contains(dot, "decision_node0 [label=\"x\\n"));
}

TEST(Graphviz, EscapesQuotes)
{
    Problem p = pdo::test::make_chain_problem();
    SearchTree tree(p, WorldState{ "say\"hi\"" });

    const std::string dot = to_graphviz(tree);
    EXPECT_TRUE(contains(dot, "say\\\"hi\\\""));
}

TEST(Graphviz, WritesFile)
{
    Problem p = pdo::test::make_riches_problem();
    SearchTree tree(p, p.get_init());
    RandomEngine rng(1);
    tree.perform_action(tree.root(), 0, rng);

    const std::string path = testing::TempDir() + "pdo_search_tree.dot";
    write_graphviz(tree, path);

    std::ifstream f(path);
    ASSERT_TRUE(f.is_open());
    std::ostringstream ss;
    ss << f.rdbuf();
    EXPECT_EQ(ss.str(), to_graphviz(tree));
}

TEST(Graphviz, UnwritablePathThrows)
{
    Problem p = pdo::test::make_riches_problem();
    SearchTree tree(p, p.get_init());
    EXPECT_THROW(write_graphviz(tree, "/nonexistent-dir/sub/tree.dot"), pdo::Error);
}

#include "Graphviz.hpp"
#include <cmath>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace pdo::search
{

static std::string escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    return out;
}

static std::string action_node_id(const std::string& name, ActionId action)
{
    return fmt::format("action_node{}_{}", name, action);
}

static void write_node(std::ostream& out,
                       const SearchTree& tree,
                       NodeId id,
                       const std::string& name)
{
    const SearchNode& n = tree.node(id);
    const Problem& problem = tree.get_problem();

    std::string atoms;
    for (const auto& atom : n.state.get_atoms())
        atoms += (atoms.empty() ? "" : ", ") + atom;
    out << "  decision_node" << name << " [label=\"" << escape(atoms) << "\\n"
        << fmt::format("{:.2f},{}", n.utility, n.visits) << "\"]\n";

    for (const auto& stats : n.tried_actions)
        out << "  " << action_node_id(name, stats.action) << " [label=\""
            << escape(problem.get_action(stats.action).get_name())
            << "\", shape=box]\n";

    size_t next_id = 0;
    for (const auto& [key, child] : n.children)
    {
        if (n.find_tried(key.first) == nullptr)
            continue;
        const std::string child_name = fmt::format("{}_{}", name, next_id++);
        write_node(out, tree, child, child_name);
        const Effect& effect =
            problem.get_action(key.first).get_effect(key.second);
        out << "  " << action_node_id(name, key.first) << " -- decision_node"
            << child_name << " [style=dashed, label=\""
            << escape(to_string(effect)) << "\"]\n";
    }

    for (const auto& stats : n.tried_actions)
        out << "  decision_node" << name << " -- "
            << action_node_id(name, stats.action)
            << fmt::format(" [label=\"{:.2f},{}\", penwidth=\"{:.3f}\"]\n",
                           stats.reward,
                           stats.visits,
                           std::pow(static_cast<double>(stats.visits), 0.25));
}

std::string to_graphviz(const SearchTree& tree, NodeId from)
{
    std::ostringstream out;
    out << "graph search_tree {\n";
    write_node(out, tree, from, "0");
    out << "}\n";
    return out.str();
}

std::string to_graphviz(const SearchTree& tree)
{
    return to_graphviz(tree, tree.root());
}

void write_graphviz(const SearchTree& tree, const std::string& path)
{
    std::ofstream f(path);
    if (!f.is_open())
        throw Error("cannot open file for writing: " + path);
    f << to_graphviz(tree);
    if (!f)
        throw Error("failed to write file: " + path);
}

} // namespace pdo::search

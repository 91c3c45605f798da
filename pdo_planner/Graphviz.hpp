/// @file Graphviz.hpp
/// Read-only export of a search tree to the Graphviz DOT language.
#pragma once
#include "SearchTree.hpp"
#include <string>

namespace pdo::search
{

/// Render the subtree rooted at @p from as an undirected DOT graph.
///
/// State nodes show their atoms, utility and visits; action nodes are
/// boxes whose incoming edge carries the tried statistics (pen width grows
/// as visits^(1/4)); dashed edges carry the effect leading to each child.
/// Children reached only by rollouts are left out.
std::string to_graphviz(const SearchTree& tree, NodeId from);

/// Render the whole tree.
std::string to_graphviz(const SearchTree& tree);

/// Save the whole tree to a DOT file.
/// @throws Error if the file cannot be written.
void write_graphviz(const SearchTree& tree, const std::string& path);

} // namespace pdo::search

/// @file Options.hpp
/// Command line options of pdo-plan.
#pragma once
#include "Mcts.hpp"
#include <string>

namespace pdo
{

/// Settings gathered from the command line.
struct Options
{
    std::string problem_path;  ///< -p, required.
    std::string dot_path;      ///< -o, empty when no tree is exported.
    size_t iterations = 1000;  ///< -i, iterations per search.
    double seconds = 0.0;      ///< -t, time per search; 0 means use -i.
    size_t max_steps = 100;    ///< -n
    search::SearchConfig config;
    bool help = false;         ///< -h / --help was given.
};

/// Parse @p argv into Options. Counts must be plain decimal integers
/// (at least 1 for -i and -H), times and factors finite decimals.
/// @throws std::invalid_argument on an unknown option, a missing or
///         malformed value, or a missing -p.
Options parse_options(int argc, const char* const argv[]);

} // namespace pdo

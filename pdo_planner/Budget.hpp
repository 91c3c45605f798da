/// @file Budget.hpp
/// Computational budgets deciding when the MCTS driver stops iterating.
#pragma once
#include <chrono>
#include <cstddef>
#include <functional>

namespace pdo::search
{

/// Called after each completed iteration with the number of iterations so
/// far (and once before the first one, with 0): true means "continue".
using Budget = std::function<bool(size_t iterations)>;

/// Allow exactly @p allowed_iterations iterations.
Budget iteration_budget(size_t allowed_iterations);

/// Allow iterating for @p allowed_time of wall-clock time, measured from the
/// first call. Once the time is up, the budget answers false and restarts
/// its clock on the next call, so one budget serves successive searches.
Budget timed_budget(std::chrono::steady_clock::duration allowed_time);

} // namespace pdo::search

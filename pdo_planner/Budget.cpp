#include "Budget.hpp"
#include <memory>
#include <optional>

namespace pdo::search
{

Budget iteration_budget(size_t allowed_iterations)
{
    return [allowed_iterations](size_t iterations)
    { return iterations < allowed_iterations; };
}

Budget timed_budget(std::chrono::steady_clock::duration allowed_time)
{
    using clock = std::chrono::steady_clock;

    // Shared so that copies of the budget see the same clock
    auto start = std::make_shared<std::optional<clock::time_point>>();
    return [start, allowed_time]([[maybe_unused]] size_t iterations)
    {
        const auto now = clock::now();
        if (!start->has_value())
            *start = now;
        if (now - **start > allowed_time)
        {
            start->reset();
            return false;
        }
        return true;
    };
}

} // namespace pdo::search

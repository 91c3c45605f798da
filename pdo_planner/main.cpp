#include "Episode.hpp"
#include "Graphviz.hpp"
#include "Options.hpp"
#include "Parser.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

namespace parser = pdo::parser;
namespace search = pdo::search;

static void print_usage(const char* prog)
{
    std::cerr << "Usage: " << prog << " -p <problem.pdo> [options]\n"
              << "Options:\n"
              << "  -p <file>     Problem description file\n"
              << "  -i <count>    Iterations per search (default 1000)\n"
              << "  -t <seconds>  Time per search instead of iterations\n"
              << "  -H <depth>    Lookahead horizon (default 50)\n"
              << "  -g <factor>   Discounting factor in (0, 1] (default 0.9)\n"
              << "  -s <seed>     Random seed (default: random)\n"
              << "  -n <steps>    Maximum number of steps (default 100)\n"
              << "  -o <file>     Write the first search tree as Graphviz DOT\n"
              << "  -v            Verbose mode (trace every iteration)\n"
              << "  -h            Show this help\n";
}

int main(int argc, char* argv[])
{
    pdo::Options options;
    try
    {
        options = pdo::parse_options(argc, argv);
    }
    catch (const std::invalid_argument& ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (options.help)
    {
        print_usage(argv[0]);
        return 0;
    }

    try
    {
        auto problem = parser::load_problem(options.problem_path);
        std::cout << problem << "\n";

        search::Budget budget =
            (options.seconds > 0.0)
                ? search::timed_budget(
                      std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                          std::chrono::duration<double>(options.seconds)))
                : search::iteration_budget(options.iterations);

        search::SearchObserver observer = nullptr;
        const std::string& dot_path = options.dot_path;
        if (!dot_path.empty())
        {
            observer = [&dot_path](const search::SearchTree& tree, size_t step)
            {
                if (step == 0)
                    search::write_graphviz(tree, dot_path);
            };
        }

        search::Mcts mcts(options.config);
        auto result =
            search::run_episode(mcts, problem, budget, options.max_steps, observer);

        std::cout << "=== Episode ===\n";
        const int wNum = 4, wAction = 20;
        std::cout << std::left << std::setw(wNum) << "#" << std::setw(wAction)
                  << "Action" << "State\n";
        std::cout << std::string(60, '-') << "\n";
        for (size_t i = 0; i < result.steps.size(); ++i)
        {
            const auto& step = result.steps[i];
            std::cout << std::left << std::setw(wNum) << (i + 1)
                      << std::setw(wAction)
                      << problem.get_action(step.action).get_name()
                      << step.state << "\n";
        }

        std::cout << "\nFinal state: " << result.final_state << "\n";
        std::cout << "Total reward: " << result.total_reward << "\n";
        std::cout << "Goal reached? " << (result.goal_reached ? "YES" : "NO")
                  << "\n";
        if (!dot_path.empty())
            std::cout << "Search tree written to " << dot_path << "\n";
        return result.goal_reached ? 0 : 2;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}

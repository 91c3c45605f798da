#include "Options.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <fmt/format.h>
#include <stdexcept>

namespace pdo
{

// Only digits: std::stoull would silently wrap a leading '-'.
static uint64_t to_integer(const char* option, const std::string& text, uint64_t min)
{
    const bool digits =
        !text.empty() && std::all_of(text.begin(),
                                     text.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
    if (!digits)
        throw std::invalid_argument(fmt::format(
            "{} expects a non-negative integer, got '{}'", option, text));

    uint64_t value = 0;
    try
    {
        value = std::stoull(text);
    }
    catch (const std::out_of_range&)
    {
        throw std::invalid_argument(
            fmt::format("{} value '{}' is out of range", option, text));
    }
    if (value < min)
        throw std::invalid_argument(
            fmt::format("{} must be at least {}, got {}", option, min, value));
    return value;
}

static double to_decimal(const char* option, const std::string& text)
{
    size_t used = 0;
    double value = 0.0;
    try
    {
        value = std::stod(text, &used);
    }
    catch (const std::logic_error&)
    {
        used = 0;
    }
    if (text.empty() || used != text.size() || !std::isfinite(value))
        throw std::invalid_argument(
            fmt::format("{} expects a number, got '{}'", option, text));
    return value;
}

Options parse_options(int argc, const char* const argv[])
{
    Options options;
    for (int i = 1; i < argc; ++i)
    {
        const char* option = argv[i];
        if (std::strcmp(option, "-v") == 0)
        {
            options.config.verbose = true;
            continue;
        }
        if (std::strcmp(option, "-h") == 0 || std::strcmp(option, "--help") == 0)
        {
            options.help = true;
            return options;
        }

        if (i + 1 >= argc)
            throw std::invalid_argument(
                fmt::format("unknown option or missing value: {}", option));
        const std::string value = argv[++i];

        if (std::strcmp(option, "-p") == 0)
            options.problem_path = value;
        else if (std::strcmp(option, "-o") == 0)
            options.dot_path = value;
        else if (std::strcmp(option, "-i") == 0)
            options.iterations = to_integer(option, value, 1);
        else if (std::strcmp(option, "-H") == 0)
            options.config.horizon = to_integer(option, value, 1);
        else if (std::strcmp(option, "-n") == 0)
            options.max_steps = to_integer(option, value, 0);
        else if (std::strcmp(option, "-s") == 0)
            options.config.seed = to_integer(option, value, 0);
        else if (std::strcmp(option, "-g") == 0)
            options.config.discounting = to_decimal(option, value);
        else if (std::strcmp(option, "-t") == 0)
        {
            options.seconds = to_decimal(option, value);
            if (!(options.seconds > 0.0))
                throw std::invalid_argument(fmt::format(
                    "-t must be a positive number of seconds, got '{}'", value));
        }
        else
            throw std::invalid_argument(fmt::format("unknown option: {}", option));
    }

    if (options.problem_path.empty())
        throw std::invalid_argument("-p is required");
    return options;
}

} // namespace pdo

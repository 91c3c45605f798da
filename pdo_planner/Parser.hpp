/// @file Parser.hpp
/// Parser for probabilistic problem descriptions.
///
/// A description is a single S-expression:
/// @code
/// (define (problem example)
///   (:init (and guns riches))
///   (:goal (or (and house yacht (not guns)) (and riches house)))
///   (:goal-reward 1)
///   (:action traffic
///    :precondition riches
///    :effect (probabilistic 9/10 (and house (not riches))
///                           1/10 (not riches))))
/// @endcode
/// Preconditions and goals are literals, conjunctions @c (and ...) or
/// disjunctions of conjunctions @c (or ...). An outcome may change the
/// reward with @c (increase (reward) X) or @c (decrease (reward) X).
/// Numbers are decimals or fractions such as @c 9/10.
#pragma once
#include "Model.hpp"
#include <string>
#include <string_view>

namespace pdo::parser
{

/// Parse a problem description held in memory.
/// @param source    Description text.
/// @param filename  Name used in error messages.
/// @throws pdo::ParseError on syntax errors.
/// @throws pdo::InvalidEffectProbabilities if an action's outcome
///         probabilities are invalid.
search::Problem parse_problem(std::string_view source,
                              const std::string& filename = "<input>");

/// Load and parse a problem description file.
/// @throws pdo::Error if the file cannot be read, plus the errors of
///         parse_problem().
search::Problem load_problem(const std::string& path);

} // namespace pdo::parser

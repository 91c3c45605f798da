/// @file Errors.hpp
/// Exception hierarchy thrown by the planner.
///
/// Every error is raised at construction or mutation time and is never
/// retried internally: it denotes a malformed problem definition or a
/// broken policy contract.
#pragma once
#include <stdexcept>
#include <string>

namespace pdo
{

/// Base class of all planner errors.
class Error: public std::runtime_error
{
public:

    using std::runtime_error::runtime_error;
};

/// Weighted outcome list is empty, has a negative weight or sums to zero.
class InvalidDistribution: public Error
{
public:

    using Error::Error;
};

/// Effect probability outside [0, 1], or the effects of an action sum to
/// more than 1.
class InvalidEffectProbabilities: public Error
{
public:

    using Error::Error;
};

/// Expanding an action that is not (or no longer) untried in a node.
class IllegalAction: public Error
{
public:

    using Error::Error;
};

/// A non-goal state offers no action at all to the caller that must act.
class NoApplicableAction: public Error
{
public:

    using Error::Error;
};

/// Syntax or semantic error in a problem description file.
class ParseError: public Error
{
public:

    using Error::Error;
};

} // namespace pdo

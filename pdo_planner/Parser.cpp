#include "Parser.hpp"
#include "SExpr.hpp"
#include <cmath>
#include <fmt/format.h>
#include <fstream>
#include <set>
#include <sstream>

namespace pdo::parser
{

using search::Action;
using search::AtomSet;
using search::Condition;
using search::Effect;
using search::Problem;
using search::WorldState;

// ── Numbers ──────────────────────────────────────────────────────────

static double to_double(const std::string& text, const Lexer& lex, int line)
{
    size_t used = 0;
    double value = 0.0;
    try
    {
        value = std::stod(text, &used);
    }
    catch (const std::exception&)
    {
        used = 0;
    }
    if (text.empty() || used != text.size() || !std::isfinite(value))
        parse_error(lex, line, "invalid number '" + text + "'");
    return value;
}

/// Decimal (0.25) or fraction (1/4).
static double parse_number(const SExpr& e, const Lexer& lex)
{
    const std::string& text = expect_atom(e, lex, "a number");
    const size_t slash = text.find('/');
    if (slash == std::string::npos)
        return to_double(text, lex, e.line);

    const double num = to_double(text.substr(0, slash), lex, e.line);
    const double den = to_double(text.substr(slash + 1), lex, e.line);
    if (den == 0.0)
        parse_error(lex, e.line, "zero denominator in '" + text + "'");
    return num / den;
}

// ── Conditions ───────────────────────────────────────────────────────

/// Atom, or (not a b ...) negating every listed atom.
static void add_literal(const SExpr& e, Condition& condition, const Lexer& lex)
{
    if (tagged(e, "not"))
    {
        if (e.children.size() < 2)
            parse_error(lex, e.line, "(not ...) expects at least one atom");
        for (size_t i = 1; i < e.children.size(); ++i)
            condition.negative.insert(
                expect_atom(e.children[i], lex, "an atom inside (not ...)"));
        return;
    }
    condition.positive.insert(expect_atom(e, lex, "an atom or (not ...)"));
}

static Condition parse_conjunction(const SExpr& e, const Lexer& lex)
{
    Condition condition;
    if (tagged(e, "and"))
    {
        for (size_t i = 1; i < e.children.size(); ++i)
            add_literal(e.children[i], condition, lex);
    }
    else
    {
        add_literal(e, condition, lex);
    }
    return condition;
}

static std::vector<Condition> parse_disjunction(const SExpr& e, const Lexer& lex)
{
    if (!tagged(e, "or"))
        return { parse_conjunction(e, lex) };

    if (e.children.size() < 2)
        parse_error(lex, e.line, "(or ...) expects at least one conjunction");
    std::vector<Condition> result;
    for (size_t i = 1; i < e.children.size(); ++i)
        result.push_back(parse_conjunction(e.children[i], lex));
    return result;
}

// ── Effects ──────────────────────────────────────────────────────────

static Effect parse_outcome(const SExpr& e, double probability, const Lexer& lex)
{
    AtomSet delete_set;
    AtomSet add_set;
    double reward = 0.0;

    auto process = [&](const SExpr& item)
    {
        if (tagged(item, "not"))
        {
            Condition negated;
            add_literal(item, negated, lex);
            delete_set.insert(negated.negative.begin(), negated.negative.end());
        }
        else if (tagged(item, "increase") || tagged(item, "decrease"))
        {
            const std::string& op = item.children[0].atom;
            if (item.children.size() != 3 || !tagged(item.children[1], "reward") ||
                item.children[1].children.size() != 1)
                parse_error(lex,
                            item.line,
                            "expected (" + op + " (reward) NUMBER)");
            const double amount = parse_number(item.children[2], lex);
            reward = (op == "increase") ? amount : -amount;
        }
        else
        {
            add_set.insert(expect_atom(
                item, lex, "an atom, (not ...) or a reward change"));
        }
    };

    if (tagged(e, "and"))
    {
        for (size_t i = 1; i < e.children.size(); ++i)
            process(e.children[i]);
    }
    else
    {
        process(e);
    }

    try
    {
        return Effect(std::move(delete_set), std::move(add_set), probability, reward);
    }
    catch (const InvalidEffectProbabilities& ex)
    {
        throw InvalidEffectProbabilities(
            fmt::format("{}:{}: {}", lex.filename, e.line, ex.what()));
    }
}

/// Plain outcome (probability 1) or (probabilistic P1 E1 P2 E2 ...).
static std::vector<Effect> parse_effect(const SExpr& e, const Lexer& lex)
{
    if (!tagged(e, "probabilistic"))
        return { parse_outcome(e, 1.0, lex) };

    if (e.children.size() % 2 != 1)
        parse_error(lex,
                    e.line,
                    "(probabilistic ...) expects probability/outcome pairs");
    std::vector<Effect> effects;
    for (size_t i = 1; i + 1 < e.children.size(); i += 2)
    {
        const double probability = parse_number(e.children[i], lex);
        effects.push_back(parse_outcome(e.children[i + 1], probability, lex));
    }
    return effects;
}

// ── Actions ──────────────────────────────────────────────────────────

static Action parse_action(const SExpr& e, const Lexer& lex)
{
    if (e.children.size() < 2)
        parse_error(lex, e.line, "(:action ...) expects a name");
    const std::string& name = expect_atom(e.children[1], lex, "an action name");
    if (e.children.size() % 2 != 0)
        parse_error(lex,
                    e.line,
                    "action '" + name + "' expects :keyword value pairs");

    std::vector<Condition> preconditions;
    std::vector<Effect> effects;
    for (size_t i = 2; i + 1 < e.children.size(); i += 2)
    {
        const std::string& key =
            expect_atom(e.children[i], lex, "an action keyword");
        const SExpr& val = e.children[i + 1];
        if (key == ":precondition")
            preconditions = parse_disjunction(val, lex);
        else if (key == ":effect")
            effects = parse_effect(val, lex);
        else
            parse_error(lex, e.children[i].line, "unknown action keyword " + key);
    }

    try
    {
        return Action(name, std::move(preconditions), std::move(effects));
    }
    catch (const InvalidEffectProbabilities& ex)
    {
        throw InvalidEffectProbabilities(
            fmt::format("{}:{}: {}", lex.filename, e.line, ex.what()));
    }
}

// ── Problem ──────────────────────────────────────────────────────────

static WorldState parse_init(const SExpr& section, const Lexer& lex)
{
    AtomSet atoms;
    auto add = [&](const SExpr& item)
    { atoms.insert(expect_atom(item, lex, "an initial atom")); };

    for (size_t i = 1; i < section.children.size(); ++i)
    {
        const SExpr& item = section.children[i];
        if (tagged(item, "and"))
        {
            for (size_t j = 1; j < item.children.size(); ++j)
                add(item.children[j]);
        }
        else
        {
            add(item);
        }
    }
    return WorldState(std::move(atoms));
}

static Problem parse_definition(const SExpr& root, const Lexer& lex)
{
    if (!tagged(root, "define"))
        parse_error(lex, root.line, "expected (define ...)");
    if (root.children.size() < 2 || !tagged(root.children[1], "problem") ||
        root.children[1].children.size() != 2)
        parse_error(lex, root.line, "expected (problem NAME) after define");
    const std::string& name =
        expect_atom(root.children[1].children[1], lex, "a problem name");

    WorldState init;
    std::vector<Condition> goals;
    bool has_goal = false;
    double goal_reward = 0.0;
    std::vector<Action> actions;
    std::set<std::string> action_names;

    for (size_t i = 2; i < root.children.size(); ++i)
    {
        const SExpr& section = root.children[i];
        if (section.is_atom || section.children.empty() ||
            !section.children[0].is_atom)
            parse_error(lex, section.line, "expected a (:section ...)");
        const std::string& tag = section.children[0].atom;

        if (tag == ":init")
        {
            init = parse_init(section, lex);
        }
        else if (tag == ":goal")
        {
            if (section.children.size() != 2)
                parse_error(lex, section.line, "(:goal ...) expects one condition");
            goals = parse_disjunction(section.children[1], lex);
            has_goal = true;
        }
        else if (tag == ":goal-reward")
        {
            if (section.children.size() != 2)
                parse_error(lex, section.line, "(:goal-reward ...) expects one number");
            goal_reward = parse_number(section.children[1], lex);
        }
        else if (tag == ":action")
        {
            Action action = parse_action(section, lex);
            if (!action_names.insert(action.get_name()).second)
                parse_error(lex,
                            section.line,
                            "duplicate action '" + action.get_name() + "'");
            actions.push_back(std::move(action));
        }
        else
        {
            parse_error(lex, section.line, "unknown section " + tag);
        }
    }

    if (!has_goal)
        parse_error(lex, root.line, "problem '" + name + "' has no (:goal ...)");
    return Problem(name, std::move(init), std::move(goals), goal_reward,
                   std::move(actions));
}

// ── Entry points ─────────────────────────────────────────────────────

Problem parse_problem(std::string_view source, const std::string& filename)
{
    Lexer lex{ source, filename };
    SExpr root = parse_document(lex);
    return parse_definition(root, lex);
}

static std::string read_file(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw Error("cannot open file: " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

Problem load_problem(const std::string& path)
{
    std::string src = read_file(path);
    return parse_problem(src, path);
}

} // namespace pdo::parser

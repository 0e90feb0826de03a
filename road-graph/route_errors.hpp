#ifndef __ROUTE_ERRORS_HPP___
#define __ROUTE_ERRORS_HPP___

#include <stdexcept>
#include <string>

/**
 * @file route_errors.hpp
 * @brief Exception types raised while loading road data and searching routes.
 */

/**
 * @brief A distance that cannot be encoded (negative, non-finite or too large).
 */
class InvalidWeight : public std::invalid_argument {
public:
    explicit InvalidWeight(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief An input line that does not match the expected route or heuristic shape.
 */
class MalformedLine : public std::runtime_error {
public:
    MalformedLine(int line_number, const std::string& what)
        : std::runtime_error("line " + std::to_string(line_number) + ": " + what),
          line_number_(line_number) {}

    int line_number() const { return line_number_; }

private:
    int line_number_;
};

/**
 * @brief A start or goal location that is not part of the road graph.
 */
class UnknownNode : public std::out_of_range {
public:
    explicit UnknownNode(const std::string& label)
        : std::out_of_range("Unknown location: " + label), label_(label) {}

    const std::string& label() const { return label_; }

private:
    std::string label_;
};

/**
 * @brief A* needed an estimate h(node, goal) that the heuristic table does not hold.
 */
class MissingHeuristic : public std::out_of_range {
public:
    MissingHeuristic(const std::string& from, const std::string& goal)
        : std::out_of_range("No heuristic estimate from " + from + " to " + goal) {}
};

/**
 * @brief The frontier was exhausted without reaching the goal.
 */
class UnreachableRoute : public std::runtime_error {
public:
    UnreachableRoute(const std::string& start, const std::string& goal)
        : std::runtime_error("Route could not be completed from " + start + " to " + goal) {}
};

#endif // __ROUTE_ERRORS_HPP___

#ifndef __ROUTE_FILE_OPERATIONS_HPP___
#define __ROUTE_FILE_OPERATIONS_HPP___

#include <istream>
#include <string>

#include "graph.hpp"
#include "heuristic.hpp"

/**
 * @file route_file_operations.hpp
 * @brief Read/write road graphs and heuristic tables from plain text files.
 *
 * Routes file: one road per line, `(from, to, distance)`; the parentheses are
 * optional and fields are trimmed.
 * Heuristic file: one estimate per line, `from goal distance`, separated by
 * whitespace.
 * Distances are decimals encoded to tenths. Blank lines are skipped in both.
 */

/**
 * @brief Parse a routes listing into a road graph.
 *
 * @throws MalformedLine if a line does not have the `(from, to, distance)` shape.
 * @throws InvalidWeight if a distance is negative or not finite.
 */
RoadGraph read_routes(std::istream& in);

/**
 * @brief Read a road graph from a routes file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 */
RoadGraph read_routes_from_file(const std::string& filename);

/**
 * @brief Parse a heuristic listing into a heuristic table.
 *
 * @throws MalformedLine if a line does not have three whitespace-separated fields.
 * @throws InvalidWeight if a distance is invalid or an (x, x) entry is not 0.
 */
HeuristicTable read_heuristic(std::istream& in);

/**
 * @brief Read a heuristic table from a heuristic file.
 *
 * @throws std::runtime_error if the file cannot be opened.
 */
HeuristicTable read_heuristic_from_file(const std::string& filename);

/**
 * @brief Write every road once, in graph order, in the routes format.
 *
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_routes_to_file(const RoadGraph& graph, const std::string& filename);

/**
 * @brief Write every estimate in the heuristic format.
 *
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_heuristic_to_file(const HeuristicTable& table, const std::string& filename);

#endif // __ROUTE_FILE_OPERATIONS_HPP___

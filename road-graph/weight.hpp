#ifndef __WEIGHT_HPP___
#define __WEIGHT_HPP___

#include <cstdint>
#include <string>

/**
 * @file weight.hpp
 * @brief Fixed-point (tenths) encoding of road distances.
 *
 * Distances are read as decimals with one significant fractional digit and
 * stored as integer tenths, so that priorities and relaxations compare exactly.
 */

/// Distance in tenths of a mile.
using Weight = std::uint64_t;

/// Number of fixed-point units per whole distance unit.
constexpr Weight WEIGHT_SCALE = 10;

/// Largest encodable weight (2^53 tenths, exactly representable as a double).
constexpr Weight MAX_WEIGHT = Weight(1) << 53;

/**
 * @brief Encode a decimal distance as tenths, rounding half away from zero.
 *
 * @param distance Non-negative finite distance.
 * @throws InvalidWeight if the distance is negative, not finite or encodes above MAX_WEIGHT.
 * @return round(distance * 10).
 */
Weight encode_weight(double distance);

/**
 * @brief Sum two weights.
 *
 * @throws InvalidWeight if the sum does not fit in a Weight.
 */
Weight add_weights(Weight a, Weight b);

/**
 * @brief Decode tenths back into a decimal distance.
 */
double decode_weight(Weight weight);

/**
 * @brief Render a weight with exactly one fractional digit (e.g. 15 -> "1.5").
 */
std::string format_weight(Weight weight);

#endif // __WEIGHT_HPP___

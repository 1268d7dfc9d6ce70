/**
 * @file size-parser.hxx
 * @brief Conversion of human readable sizes ("64M", "1k", "4096") to bytes.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace splittar {

/**
 * @brief Parse a size-with-suffix expression into a positive byte count.
 *
 * The grammar is `<digits>[suffix]`. Lowercase suffixes are decimal powers
 * (b=1, k=1000, m=1000^2, g, t, p=1000^5), uppercase suffixes are binary
 * powers (B=1, K=1024, M=1024^2, G, T, P=1024^5). `b` and `B` both mean one
 * byte.
 *
 * @param expression The expression to parse; a trailing digit means no suffix.
 * @return std::int64_t The size in bytes, always > 0.
 * @throws SizeParseError for an empty expression, an unknown suffix, a
 * malformed number, an overflowing product or a non-positive result.
 */
std::int64_t parse_size(std::string_view expression);

/**
 * @brief Multiplier for a single suffix character.
 *
 * @return std::int64_t The multiplier, or 0 when @p suffix is unknown.
 */
std::int64_t size_multiplier(char suffix) noexcept;

} // namespace splittar

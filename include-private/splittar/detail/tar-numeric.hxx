#pragma once

#include "tar-header.hxx"

#include <cstddef>
#include <cstdint>
#include <string>

namespace splittar::detail {

/**
 * @brief Largest value an octal field of @p field_size bytes can hold.
 *
 * One byte of every field is reserved for the NUL terminator.
 */
std::int64_t max_octal(std::size_t field_size);

/**
 * @brief Store @p value in a numeric header field.
 *
 * Values that fit are written as zero-padded, NUL-terminated octal ASCII.
 * Larger or negative values use the GNU base-256 encoding.
 */
void format_numeric(char *field, std::size_t field_size, std::int64_t value);

/**
 * @brief Parse a base-256 encoded integer from a TAR header field.
 *
 * @return int64_t Decoded signed integer; returns INT64_MIN/INT64_MAX on
 * overflow.
 */
std::int64_t parse_base256(const char *p, std::size_t char_cnt);

/**
 * @brief Parse an octal ASCII integer, stopping at the first NUL.
 */
std::int64_t parse_octal(const char *p, std::size_t n);

/**
 * @brief Parse a numeric field in either octal or base-256 encoding.
 */
std::int64_t parse_numeric(const char *p, std::size_t n);

/**
 * @brief Sum of the header bytes with the checksum field taken as spaces.
 */
unsigned int compute_checksum(const TarHeader &header);

/**
 * @brief Compute and store the header checksum ("dddddd\0 ").
 */
void seal_checksum(TarHeader &header);

/**
 * @brief Extract a possibly non-null-terminated text field.
 */
std::string extract_string(const char *field, std::size_t field_size);

/**
 * @brief Check whether a 512-byte TAR block is entirely zeros.
 */
bool is_zero_block(const char *block);

/** @brief Bytes of zero padding needed after a body of @p size bytes. */
inline std::size_t padding_for(std::uint64_t size) {
  return static_cast<std::size_t>((block_size - (size % block_size)) %
                                  block_size);
}

} // namespace splittar::detail

/**
 * @file split-options.hxx
 * @brief Parameters and result of splitting one stream into tar entries.
 */

#pragma once

#include <cstdint>
#include <string>

namespace splittar {

/** @brief Default chunk size, 64 MiB. */
inline constexpr std::int64_t default_chunk_size = std::int64_t(1) << 26;

/** @brief Default suffix width for EntryNaming::Index. */
inline constexpr int default_index_width = 8;

/** @brief Default suffix width for EntryNaming::BaseName. */
inline constexpr int default_basename_width = 2;

/** @brief How chunk entries are named. */
enum class EntryNaming {
  Index,   /**< @brief "00000000", "00000001", ... */
  BaseName /**< @brief "<base>.00", "<base>.01", ... */
};

/** @brief What to do when the archive accepts fewer body bytes than offered. */
enum class ShortWritePolicy {
  Fail, /**< @brief Abort the run with ShortWriteError. */
  Retry /**< @brief Log a warning and write the remainder. */
};

struct SplitOptions {
  std::int64_t chunk_size = default_chunk_size;
  EntryNaming naming = EntryNaming::Index;
  int suffix_width = default_index_width;
  std::string base_name; /**< @brief Required for EntryNaming::BaseName. */
  ShortWritePolicy short_write_policy = ShortWritePolicy::Fail;
};

/**
 * @brief Counters reported at the end of a split.
 */
struct SplitSummary {
  std::int64_t entries = 0;
  std::int64_t bytes = 0;
};

/**
 * @brief Check that @p options can drive a split.
 *
 * @throws ConfigError for a non-positive chunk size or suffix width, or an
 * empty base name in EntryNaming::BaseName mode.
 */
void validate(const SplitOptions &options);

/**
 * @brief Name of the entry holding chunk number @p index.
 *
 * The index is zero padded to options.suffix_width digits; wider indices are
 * written in full.
 */
std::string entry_name(const SplitOptions &options, std::int64_t index);

/** @brief Parse "index" or "basename". @throws ConfigError otherwise. */
EntryNaming parse_entry_naming(const std::string &text);

} // namespace splittar

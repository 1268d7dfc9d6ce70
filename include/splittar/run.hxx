/**
 * @file run.hxx
 * @brief One complete split: open the endpoints, split, finalize, close.
 */

#pragma once

#include <splittar/entry-header.hxx>
#include <splittar/split-options.hxx>

#include <cstdint>
#include <optional>
#include <string>

namespace splittar {

/** @brief Whether a run closes a descriptor it was handed. */
enum class Ownership {
  Close, /**< @brief The run owns the descriptor and closes it at the end. */
  Borrow /**< @brief The caller keeps the descriptor open. */
};

/**
 * @struct Endpoint
 * @brief Where a run reads from or writes to.
 *
 * Either a path (`-` selects standard input or output, which is borrowed) or
 * an already open descriptor with explicit ownership. Files opened from a
 * path are always closed by the run.
 */
struct Endpoint {
  std::string path;
  int descriptor = -1;
  Ownership ownership = Ownership::Borrow;

  static Endpoint from_path(std::string path);
  static Endpoint from_descriptor(int descriptor, Ownership ownership);

  bool is_path() const { return descriptor < 0; }
  bool is_standard_stream() const { return is_path() && path == "-"; }

  /** @brief Human readable form for messages, e.g. "stdin" or "big.bin". */
  std::string display_name(bool input) const;
};

/**
 * @struct RunConfig
 * @brief Resolved parameters of one invocation; not modified by run().
 */
struct RunConfig {
  SplitOptions split;
  Endpoint source = Endpoint::from_path("-");
  Endpoint target = Endpoint::from_path("-");
  /** @brief Re-read a file target after writing and check its entries. */
  bool verify = false;
  /** @brief Header template; built from the host identity when empty. */
  std::optional<EntryHeader> header_template;
};

/**
 * @brief Chunk size to use for a source of known length.
 *
 * When @p descriptor is a regular file whose size is positive and smaller
 * than @p chunk_size, the file size is returned; otherwise @p chunk_size.
 */
std::int64_t effective_chunk_size(int descriptor, std::int64_t chunk_size);

/**
 * @brief Base name used for EntryNaming::BaseName when none is configured.
 *
 * The file name of a path source, "stdin" for standard input, "fd<N>" for
 * other descriptors.
 */
std::string default_base_name(const Endpoint &source);

/**
 * @brief Split config.source into a tar archive written to config.target.
 *
 * The source and target are closed exactly once on every path, subject to
 * their ownership. If both the split and a close fail, the CloseError thrown
 * carries the split failure as its primary cause.
 *
 * @throws ConfigError before any I/O for invalid options.
 * @throws OpenError, SourceReadError, TargetWriteError, CloseError,
 * ArchiveFormatError (verification mismatch).
 */
SplitSummary run(const RunConfig &config);

/**
 * @brief Read a tar file back and count its regular entries and payload.
 */
SplitSummary scan_archive(const std::string &path);

} // namespace splittar

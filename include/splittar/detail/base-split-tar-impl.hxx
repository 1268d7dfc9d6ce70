#pragma once

#include <splittar/entry-header.hxx>
#include <splittar/split-options.hxx>
#include <splittar/tar-writer.hxx>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ios>
#include <vector>

namespace splittar::detail {
/**
 * @class BaseSplitTarImpl
 * @brief Chunking state machine that turns a byte source into tar entries.
 *
 * The source is reached through a read function with Boost.Iostreams
 * semantics: it returns the number of bytes read, -1 at end of stream, and
 * throws on error. A whole chunk is buffered before its header is written, so
 * a failing source never leaves a partial entry in the archive.
 */
class BaseSplitTarImpl {
public:
  /** @enum State States of one run. */
  enum class State { Reading, Flushing, Done };

  using read_function = std::function<std::streamsize(char *, std::streamsize)>;

  SplitOptions options;
  EntryHeader header; /**< @brief Template, renamed and resized per chunk. */
  std::vector<char> buffer;
  std::size_t fill_offset = 0; /**< @brief Live bytes of the current chunk. */
  std::int64_t chunk_index = 0;
  bool end_of_stream = false;
  State state = State::Reading;
  SplitSummary summary;

  /**
   * @param options Validated split options.
   * @param header_template Header reused for every entry of the run.
   */
  BaseSplitTarImpl(SplitOptions options, EntryHeader header_template);

  /**
   * @brief Drive the state machine until the source is exhausted.
   *
   * Does not finalize @p target; the caller writes the trailer.
   *
   * @throws SourceReadError, TargetWriteError (ShortWriteError under
   * ShortWritePolicy::Fail), ConfigError if the chunk buffer cannot be
   * allocated.
   */
  SplitSummary run(const read_function &read, TarWriter &target);

private:
  void fill(const read_function &read);
  void flush(TarWriter &target);
  void write_body(const std::string &name, TarWriter &target);
};
} // namespace splittar::detail

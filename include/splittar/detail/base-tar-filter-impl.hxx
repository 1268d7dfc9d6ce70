#pragma once

#include <splittar/tar-entry-info.hxx>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace splittar::detail {
/**
 * @class BaseTarFilterImpl
 * @brief Core TAR parsing logic that operates on char buffers.
 *
 * This class implements a small state machine to parse TAR archives streamed
 * in 512-byte blocks. Regular-file bodies are copied to the output, pax
 * extended headers are decoded and applied to the entry that follows, and
 * every other entry is skipped along with its body. It is independent of any
 * iostreams interfaces so the templated adapter layer stays thin.
 */
class BaseTarFilterImpl {
public:
  /** @enum State Parsing states for the internal state machine. */
  enum class State {
    ReadHeader,
    ReadExtendedHeader,
    ReadFileData,
    SkipData,
    SkipPadding,
    Done
  };

  std::vector<char>
      header_buffer; /**< @brief Buffer for accumulating a 512-byte header. */
  std::size_t header_bytes_read =
      0; /**< @brief Number of header bytes currently buffered. */
  std::size_t file_size_ =
      0; /**< @brief Size of the current entry body in bytes. */
  std::size_t file_bytes_read =
      0; /**< @brief Number of body bytes already consumed. */
  std::size_t padding_bytes =
      0; /**< @brief Number of padding bytes after the body to align to 512. */
  std::size_t padding_bytes_skipped =
      0; /**< @brief Number of padding bytes already skipped. */
  State state = State::ReadHeader; /**< @brief Current state of the parser. */
  std::string extended_records; /**< @brief Raw pax records being collected. */
  TarEntryInfo current_entry;   /**< @brief Entry currently being processed. */
  std::map<std::string, std::string>
      pending_records; /**< @brief pax records applying to the next entry. */
  std::size_t entries_seen = 0; /**< @brief Regular entries parsed so far. */
  TarEntryObserver observer;    /**< @brief Optional per-entry callback. */

  /**
   * @brief Construct a BaseTarFilterImpl and initialize internal state.
   *
   * @param observer Called with each regular entry's metadata; may be empty.
   */
  explicit BaseTarFilterImpl(TarEntryObserver observer = {});

  /**
   * @brief Process input TAR data and extract file contents to the destination
   * buffer.
   *
   * Both source and destination pointers are advanced as bytes are
   * consumed/produced. The function returns false when there is no further
   * work (archive finished).
   *
   * @throws ArchiveFormatError when a header checksum does not match.
   */
  bool filter(const char *&src_begin, const char *const src_end,
              char *&dest_begin, const char *const dest_end, bool flush);

  /**
   * @brief Reset the parser to initial state for reuse.
   */
  void close();

private:
  void begin_entry(const char *block);
  void finish_extended_header();
};
} // namespace splittar::detail

/**
 * @file tar-writer.hxx
 * @brief Streaming POSIX pax/ustar archive writer.
 */

#pragma once

#include <splittar/entry-header.hxx>

#include <cstdint>
#include <ios>
#include <ostream>

namespace splittar {

/**
 * @brief Serializes header/body pairs onto an output stream as a tar archive.
 *
 * Every entry gets a pax extended header carrying its access and change
 * times (and any field that does not fit the ustar header), followed by the
 * ustar header and the body padded to 512 bytes. close() appends the two
 * zero blocks that end the archive.
 *
 * The writer does not own the stream. Any std::ostream works, including a
 * boost::iostreams::stream over a file descriptor sink or a
 * back_insert_device for in-memory archives.
 *
 * @code{.cpp}
 * std::string archive;
 * boost::iostreams::stream<
 *     boost::iostreams::back_insert_device<std::string>> out(archive);
 * splittar::TarWriter tar(out);
 * tar.write_header(header);
 * tar.write(data, header.size);
 * tar.close();
 * @endcode
 */
class TarWriter {
public:
  explicit TarWriter(std::ostream &out);

  TarWriter(const TarWriter &) = delete;
  TarWriter &operator=(const TarWriter &) = delete;

  /**
   * @brief Start a new entry.
   *
   * @throws ArchiveFormatError if the previous body is incomplete, the writer
   * is closed or the header is not a regular file.
   * @throws std::ios_base::failure if the stream rejects the header.
   */
  void write_header(const EntryHeader &header);

  /**
   * @brief Append body bytes to the current entry.
   *
   * @return std::streamsize Number of bytes the stream accepted; may be less
   * than @p n when the underlying buffer performs a short write.
   * @throws ArchiveFormatError when @p n exceeds the bytes left in the entry.
   * @throws std::ios_base::failure on stream errors.
   */
  std::streamsize write(const char *s, std::streamsize n);

  /**
   * @brief Pad the last entry, write the archive trailer and flush.
   *
   * Calling close() again has no effect.
   */
  void close();

  /** @brief Body bytes still expected for the current entry. */
  std::int64_t remaining() const { return remaining_; }

  /** @brief Number of entries started so far. */
  std::int64_t entries() const { return entries_; }

  bool closed() const { return closed_; }

private:
  void write_extended_header(const EntryHeader &header);
  void write_padding();
  void write_block_data(const char *s, std::size_t n);

  std::ostream &out_;
  std::int64_t remaining_ = 0;
  std::size_t pending_padding_ = 0;
  std::int64_t entries_ = 0;
  bool closed_ = false;
};

} // namespace splittar

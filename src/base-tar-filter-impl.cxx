#include <splittar/detail/base-tar-filter-impl.hxx>
#include <splittar/detail/tar-header.hxx>
#include <splittar/detail/tar-numeric.hxx>
#include <splittar/error.hxx>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <exception>
#include <string>
#include <utility>

namespace splittar::detail {
namespace {

/**
 * @brief Check whether a header entry represents a regular file.
 *
 * According to the TAR standard, a typeflag of '0' or a NUL indicates
 * a regular file entry. Other typeflags represent directories, symlinks, etc.
 */
inline bool is_regular_file(const TarHeader *tar) {
  return tar->typeflag[0] == typeflag::regular ||
         tar->typeflag[0] == typeflag::regular_old;
}

/**
 * @brief Verify the header checksum against the stored octal value.
 */
void check_header(const TarHeader *tar) {
  auto const stored = parse_octal(tar->chksum, sizeof(tar->chksum));
  auto const computed = compute_checksum(*tar);
  if (stored != static_cast<std::int64_t>(computed))
    throw ArchiveFormatError(
        "tar header checksum mismatch for \"" +
        extract_string(tar->name, sizeof(tar->name)) + "\": stored " +
        std::to_string(stored) + ", computed " + std::to_string(computed));
}

/**
 * @brief Decode the "<len> <key>=<value>\n" records of a pax header.
 */
std::map<std::string, std::string> parse_pax_records(const std::string &data) {
  std::map<std::string, std::string> records;
  std::size_t pos = 0;
  while (pos < data.size() && data[pos] != '\0') {
    auto const space = data.find(' ', pos);
    if (space == std::string::npos)
      throw ArchiveFormatError("malformed pax record length");

    std::size_t len = 0;
    try {
      len = std::stoul(data.substr(pos, space - pos));
    } catch (const std::exception &) {
      std::throw_with_nested(ArchiveFormatError("malformed pax record length"));
    }
    if (len == 0 || pos + len > data.size() || data[pos + len - 1] != '\n')
      throw ArchiveFormatError("malformed pax record");

    auto const record = data.substr(space + 1, pos + len - 1 - (space + 1));
    auto const eq = record.find('=');
    if (eq == std::string::npos)
      throw ArchiveFormatError("pax record without '=': " + record);
    records[record.substr(0, eq)] = record.substr(eq + 1);
    pos += len;
  }
  return records;
}

/**
 * @brief Build entry metadata from a ustar header, then apply pax overrides.
 */
TarEntryInfo decode_entry(const TarHeader *tar,
                          std::map<std::string, std::string> records) {
  TarEntryInfo info;
  info.name = extract_string(tar->name, sizeof(tar->name));
  if (std::memcmp(tar->magic, "ustar", 5) == 0 && tar->prefix[0] != '\0')
    info.name =
        extract_string(tar->prefix, sizeof(tar->prefix)) + '/' + info.name;
  info.size = parse_numeric(tar->size, sizeof(tar->size));
  info.mode =
      static_cast<std::uint32_t>(parse_octal(tar->mode, sizeof(tar->mode)));
  info.uid = parse_numeric(tar->uid, sizeof(tar->uid));
  info.gid = parse_numeric(tar->gid, sizeof(tar->gid));
  info.uname = extract_string(tar->uname, sizeof(tar->uname));
  info.gname = extract_string(tar->gname, sizeof(tar->gname));
  info.mtime =
      static_cast<double>(parse_numeric(tar->mtime, sizeof(tar->mtime)));

  try {
    for (const auto &[key, value] : records) {
      if (key == "path")
        info.name = value;
      else if (key == "size")
        info.size = std::stoll(value);
      else if (key == "uid")
        info.uid = std::stoll(value);
      else if (key == "gid")
        info.gid = std::stoll(value);
      else if (key == "uname")
        info.uname = value;
      else if (key == "gname")
        info.gname = value;
      else if (key == "mtime")
        info.mtime = std::stod(value);
      else if (key == "atime")
        info.atime = std::stod(value);
      else if (key == "ctime")
        info.ctime = std::stod(value);
    }
  } catch (const std::exception &) {
    std::throw_with_nested(
        ArchiveFormatError("invalid pax value for entry " + info.name));
  }
  info.pax_records = std::move(records);

  if (info.size < 0)
    throw ArchiveFormatError("negative size for entry " + info.name);
  return info;
}

} // unnamed namespace

/**
 * @brief Construct a BaseTarFilterImpl and initialize state.
 *
 * Use this constructor to create or reset the internal state prior to feeding
 * TAR stream data into filter().
 */
BaseTarFilterImpl::BaseTarFilterImpl(TarEntryObserver observer)
    : observer(std::move(observer)) {}

/**
 * @brief Classify a complete header block and pick the next state.
 */
void BaseTarFilterImpl::begin_entry(const char *block) {
  auto tar = reinterpret_cast<const TarHeader *>(block);
  check_header(tar);

  file_bytes_read = 0;
  padding_bytes_skipped = 0;

  if (tar->typeflag[0] == typeflag::pax_extended) {
    auto const size = parse_numeric(tar->size, sizeof(tar->size));
    if (size < 0)
      throw ArchiveFormatError("negative pax header size");
    file_size_ = static_cast<std::size_t>(size);
    padding_bytes = padding_for(file_size_);
    extended_records.clear();
    state = file_size_ > 0 ? State::ReadExtendedHeader : State::SkipPadding;
    return;
  }

  if (is_regular_file(tar)) {
    current_entry = decode_entry(tar, std::move(pending_records));
    pending_records.clear();
    file_size_ = static_cast<std::size_t>(current_entry.size);
    padding_bytes = padding_for(file_size_);
    ++entries_seen;
    if (observer)
      observer(current_entry);
    state = file_size_ > 0 ? State::ReadFileData : State::SkipPadding;
    return;
  }

  // Directories, links, pax global headers: skip the body.
  pending_records.clear();
  auto const size = parse_numeric(tar->size, sizeof(tar->size));
  file_size_ = size > 0 ? static_cast<std::size_t>(size) : 0;
  padding_bytes = padding_for(file_size_);
  state = file_size_ > 0 ? State::SkipData : State::SkipPadding;
}

void BaseTarFilterImpl::finish_extended_header() {
  for (auto &[key, value] : parse_pax_records(extended_records))
    pending_records[key] = std::move(value);
  extended_records.clear();
}

/**
 * @brief Main streaming filter: read headers, extract file data and skip
 * padding.
 *
 * This function implements a small state machine that:
 *  - reads 512-byte TAR headers and verifies their checksum,
 *  - collects pax extended header records for the following entry,
 *  - copies regular file payload bytes into the destination buffer,
 *  - skips the bodies of other entry types and the padding to 512-byte blocks,
 *  - recognizes archive termination (a zero block).
 *
 * The function is designed for use in push-style filtering where src_begin is
 * advanced as bytes are consumed and dest_begin advanced as bytes are produced.
 *
 * @param flush Ignored; present for API compatibility with Boost.Iostreams
 * filter.
 */
bool BaseTarFilterImpl::filter(const char *&src_begin,
                               const char *const src_end, char *&dest_begin,
                               const char *const dest_end, bool /*flush*/) {
  while (src_begin < src_end && dest_begin < dest_end) {
    switch (state) {
    case State::ReadHeader: {
      auto needed = block_size - header_bytes_read;
      auto available = static_cast<std::size_t>(src_end - src_begin);
      auto to_copy = std::min(needed, available);

      if (header_buffer.size() < block_size)
        header_buffer.resize(block_size);
      std::memcpy(&header_buffer[header_bytes_read], src_begin,
                  to_copy * sizeof(char));
      src_begin += to_copy;
      header_bytes_read += to_copy;

      if (header_bytes_read == block_size) {
        header_bytes_read = 0;
        if (is_zero_block(header_buffer.data())) {
          state = State::Done;
          return false;
        }
        begin_entry(header_buffer.data());
      }
      break;
    }

    case State::ReadExtendedHeader: {
      auto remaining = file_size_ - file_bytes_read;
      auto src_avail = static_cast<std::size_t>(src_end - src_begin);
      auto to_copy = std::min(remaining, src_avail);

      extended_records.append(src_begin, to_copy);
      src_begin += to_copy;
      file_bytes_read += to_copy;

      if (file_bytes_read == file_size_) {
        finish_extended_header();
        state = State::SkipPadding;
      }
      break;
    }

    case State::ReadFileData: {
      auto remaining = file_size_ - file_bytes_read;
      auto src_avail = static_cast<std::size_t>(src_end - src_begin);
      auto dest_space = static_cast<std::size_t>(dest_end - dest_begin);

      auto const to_copy = std::min(remaining, std::min(src_avail, dest_space));
      std::copy(src_begin, src_begin + to_copy, dest_begin);

      src_begin += to_copy;
      dest_begin += to_copy;
      file_bytes_read += to_copy;

      if (file_bytes_read == file_size_)
        state = State::SkipPadding;
      break;
    }

    case State::SkipData: {
      auto remaining = file_size_ - file_bytes_read;
      auto src_avail = static_cast<std::size_t>(src_end - src_begin);
      auto to_skip = std::min(remaining, src_avail);

      src_begin += to_skip;
      file_bytes_read += to_skip;

      if (file_bytes_read == file_size_)
        state = State::SkipPadding;
      break;
    }

    case State::SkipPadding: {
      auto remaining = padding_bytes - padding_bytes_skipped;
      auto src_avail = static_cast<std::size_t>(src_end - src_begin);
      auto to_skip = std::min(remaining, src_avail);

      src_begin += to_skip;
      padding_bytes_skipped += to_skip;

      if (padding_bytes_skipped == padding_bytes)
        state = State::ReadHeader;
      break;
    }

    case State::Done:
      return false;
    }
  }

  return state != State::Done;
}

/**
 * @brief Reset internal parser state so the filter can be reused.
 *
 * Clears any buffered partial header data, pending pax records and counters.
 * After close() the filter behaves as if newly constructed, except that the
 * observer is kept.
 */
void BaseTarFilterImpl::close() {
  state = State::ReadHeader;
  header_bytes_read = 0;
  file_bytes_read = 0;
  padding_bytes = 0;
  padding_bytes_skipped = 0;
  file_size_ = 0;
  header_buffer.clear();
  extended_records.clear();
  pending_records.clear();
  current_entry = TarEntryInfo{};
  entries_seen = 0;
}
} // namespace splittar::detail

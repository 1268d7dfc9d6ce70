#include <splittar/detail/tar-numeric.hxx>
#include <splittar/error.hxx>
#include <splittar/tar-writer.hxx>

#include <boost/iostreams/write.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <string>

namespace splittar {
namespace {

using detail::block_size;
using detail::TarHeader;

constexpr const char *pax_header_dir = "PaxHeaders.0/";

const std::array<char, block_size> zero_block{};

/**
 * @brief Format one pax record: "<len> <key>=<value>\n".
 *
 * The length prefix counts itself, so it is grown until it is stable.
 */
std::string pax_record(const std::string &key, const std::string &value) {
  auto const base = key.size() + value.size() + 3;
  auto len = base;
  while (true) {
    auto const candidate = base + std::to_string(len).size();
    if (candidate == len)
      break;
    len = candidate;
  }
  return std::to_string(len) + ' ' + key + '=' + value + '\n';
}

std::int64_t epoch_seconds(EntryHeader::time_point tp) {
  return std::chrono::floor<std::chrono::seconds>(tp)
      .time_since_epoch()
      .count();
}

/**
 * @brief Seconds since the epoch with the fraction trimmed of trailing zeros.
 *
 * Times before the epoch are written as a negative decimal, so 1.5 s before
 * it is "-1.5".
 */
std::string pax_time(EntryHeader::time_point tp) {
  using namespace std::chrono;
  auto const whole = floor<seconds>(tp);
  auto secs = whole.time_since_epoch().count();
  auto nanos = duration_cast<nanoseconds>(tp - whole).count();
  if (nanos == 0)
    return std::to_string(secs);

  std::string text;
  if (secs < 0) {
    text = "-";
    secs = -(secs + 1);
    nanos = 1'000'000'000 - nanos;
  }
  auto fraction = std::to_string(nanos);
  fraction.insert(0, 9 - fraction.size(), '0');
  fraction.erase(fraction.find_last_not_of('0') + 1);
  return text + std::to_string(secs) + '.' + fraction;
}

bool has_fraction(EntryHeader::time_point tp) {
  return std::chrono::floor<std::chrono::seconds>(tp) != tp;
}

void copy_field(char *field, std::size_t field_size, const std::string &value) {
  std::memcpy(field, value.data(), std::min(field_size, value.size()));
}

/**
 * @brief Fill the ustar header fields shared by pax and entry headers.
 */
TarHeader make_ustar_header(const EntryHeader &header, const std::string &name,
                            char typeflag, std::int64_t size) {
  TarHeader tar;
  std::memset(&tar, 0, sizeof(tar));
  copy_field(tar.name, sizeof(tar.name), name);
  detail::format_numeric(tar.mode, sizeof(tar.mode), header.mode);
  detail::format_numeric(tar.uid, sizeof(tar.uid), header.uid);
  detail::format_numeric(tar.gid, sizeof(tar.gid), header.gid);
  detail::format_numeric(tar.size, sizeof(tar.size), size);
  detail::format_numeric(tar.mtime, sizeof(tar.mtime),
                         epoch_seconds(header.mtime));
  tar.typeflag[0] = typeflag;
  std::memcpy(tar.magic, "ustar", 6);
  std::memcpy(tar.version, "00", 2);
  copy_field(tar.uname, sizeof(tar.uname), header.uname);
  copy_field(tar.gname, sizeof(tar.gname), header.gname);
  detail::format_numeric(tar.devmajor, sizeof(tar.devmajor), header.devmajor);
  detail::format_numeric(tar.devminor, sizeof(tar.devminor), header.devminor);
  detail::seal_checksum(tar);
  return tar;
}

} // unnamed namespace

TarWriter::TarWriter(std::ostream &out) : out_(out) {}

void TarWriter::write_block_data(const char *s, std::size_t n) {
  if (!out_)
    throw std::ios_base::failure("archive stream is in a failed state");
  auto const written =
      boost::iostreams::write(out_, s, static_cast<std::streamsize>(n));
  if (written != static_cast<std::streamsize>(n))
    throw std::ios_base::failure("short write of " + std::to_string(n) +
                                 " tar block bytes (" +
                                 std::to_string(written) + " written)");
}

void TarWriter::write_padding() {
  if (pending_padding_ > 0)
    write_block_data(zero_block.data(), pending_padding_);
  pending_padding_ = 0;
}

void TarWriter::write_extended_header(const EntryHeader &header) {
  std::string records;
  if (header.name.size() > sizeof(TarHeader::name))
    records += pax_record("path", header.name);
  if (header.size > detail::max_octal(sizeof(TarHeader::size)))
    records += pax_record("size", std::to_string(header.size));
  if (header.uid > detail::max_octal(sizeof(TarHeader::uid)))
    records += pax_record("uid", std::to_string(header.uid));
  if (header.gid > detail::max_octal(sizeof(TarHeader::gid)))
    records += pax_record("gid", std::to_string(header.gid));
  if (header.uname.size() > sizeof(TarHeader::uname))
    records += pax_record("uname", header.uname);
  if (header.gname.size() > sizeof(TarHeader::gname))
    records += pax_record("gname", header.gname);
  if (has_fraction(header.mtime))
    records += pax_record("mtime", pax_time(header.mtime));
  records += pax_record("atime", pax_time(header.atime));
  records += pax_record("ctime", pax_time(header.ctime));
  for (const auto &[key, value] : header.xattrs)
    records += pax_record("SCHILY.xattr." + key, value);

  auto const pax_name = pax_header_dir + header.name;
  auto const tar =
      make_ustar_header(header, pax_name, detail::typeflag::pax_extended,
                        static_cast<std::int64_t>(records.size()));
  records.append(detail::padding_for(records.size()), '\0');

  write_block_data(reinterpret_cast<const char *>(&tar), sizeof(tar));
  write_block_data(records.data(), records.size());
}

void TarWriter::write_header(const EntryHeader &header) {
  if (closed_)
    throw ArchiveFormatError("archive is already closed");
  if (remaining_ > 0)
    throw ArchiveFormatError("missed writing " + std::to_string(remaining_) +
                             " bytes of the previous entry");
  if (header.type != EntryType::Regular)
    throw ArchiveFormatError("unsupported entry type for " + header.name);
  if (header.size < 0)
    throw ArchiveFormatError("negative size for entry " + header.name);

  write_padding();
  write_extended_header(header);

  auto const tar = make_ustar_header(header, header.name,
                                     detail::typeflag::regular, header.size);
  write_block_data(reinterpret_cast<const char *>(&tar), sizeof(tar));

  remaining_ = header.size;
  pending_padding_ =
      detail::padding_for(static_cast<std::uint64_t>(header.size));
  ++entries_;
}

std::streamsize TarWriter::write(const char *s, std::streamsize n) {
  if (closed_)
    throw ArchiveFormatError("archive is already closed");
  if (n > remaining_)
    throw ArchiveFormatError("write too long: " + std::to_string(n) +
                             " bytes offered, " + std::to_string(remaining_) +
                             " left in entry");
  if (!out_)
    throw std::ios_base::failure("archive stream is in a failed state");
  if (n <= 0)
    return 0;

  auto const written = boost::iostreams::write(out_, s, n);
  if (written < 0)
    throw std::ios_base::failure("archive stream rejected entry data");
  remaining_ -= written;
  return written;
}

void TarWriter::close() {
  if (closed_)
    return;
  if (remaining_ > 0)
    throw ArchiveFormatError("missed writing " + std::to_string(remaining_) +
                             " bytes of the last entry");

  write_padding();
  for (std::size_t i = 0; i < detail::trailer_blocks; ++i)
    write_block_data(zero_block.data(), zero_block.size());
  out_.flush();
  if (!out_)
    throw std::ios_base::failure("failed to flush archive stream");
  closed_ = true;
}

} // namespace splittar

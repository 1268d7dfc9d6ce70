#include <splittar/detail/tar-numeric.hxx>

#include <cstdio>
#include <cstring>

namespace splittar::detail {
namespace {

/**
 * @brief Write @p value as big-endian two's complement with the high bit of
 * the first byte set (GNU base-256).
 */
void format_base256(char *field, std::size_t field_size, std::int64_t value) {
  for (std::size_t i = field_size; i-- > 0;) {
    field[i] = static_cast<char>(value & 0xff);
    value >>= 8;
  }
  field[0] = static_cast<char>(static_cast<unsigned char>(field[0]) | 0x80);
}

} // unnamed namespace

std::int64_t max_octal(std::size_t field_size) {
  return (std::int64_t(1) << (3 * (field_size - 1))) - 1;
}

void format_numeric(char *field, std::size_t field_size, std::int64_t value) {
  if (value < 0 || value > max_octal(field_size)) {
    format_base256(field, field_size, value);
    return;
  }
  std::memset(field, '0', field_size - 1);
  field[field_size - 1] = '\0';
  auto v = static_cast<std::uint64_t>(value);
  for (std::size_t i = field_size - 1; i-- > 0 && v != 0; v >>= 3)
    field[i] = static_cast<char>('0' + (v & 7));
}

/**
 * GNU tar and newer POSIX extensions allow storing file sizes and other
 * numeric fields using a base-256 (binary) representation when values do
 * not fit into the traditional octal ASCII field. The value is a
 * variable-length two's complement integer in big-endian order.
 */
std::int64_t parse_base256(const char *_p, std::size_t char_cnt) {
  uint64_t l;
  auto p = reinterpret_cast<const unsigned char *>(_p);
  auto c = *p;
  unsigned char neg;

  if (c & 0x40) {
    neg = 0xff;
    c |= 0x80;
    l = ~uint64_t(0);
  } else {
    neg = 0;
    c &= 0x7f;
    l = 0;
  }

  while (char_cnt > sizeof(int64_t)) {
    --char_cnt;
    if (c != neg)
      return neg ? INT64_MIN : INT64_MAX;
    c = *++p;
  }

  if ((c ^ neg) & 0x80)
    return neg ? INT64_MIN : INT64_MAX;

  while (--char_cnt > 0) {
    l = (l << 8) | c;
    c = *++p;
  }
  l = (l << 8) | c;
  return static_cast<int64_t>(l);
}

std::int64_t parse_octal(const char *p, std::size_t n) {
  std::int64_t result = 0;
  for (std::size_t i = 0; i < n && p[i]; ++i)
    if (p[i] >= '0' && p[i] <= '7')
      result = (result << 3) + (p[i] - '0');
  return result;
}

std::int64_t parse_numeric(const char *p, std::size_t n) {
  if (static_cast<unsigned char>(p[0]) & 0x80)
    return parse_base256(p, n);
  return parse_octal(p, n);
}

unsigned int compute_checksum(const TarHeader &header) {
  auto bytes = reinterpret_cast<const unsigned char *>(&header);
  unsigned int sum = 0;
  for (std::size_t i = 0; i < block_size; ++i)
    sum += bytes[i];
  for (std::size_t i = 0; i < sizeof(header.chksum); ++i)
    sum += ' ' - static_cast<unsigned char>(header.chksum[i]);
  return sum;
}

void seal_checksum(TarHeader &header) {
  std::memset(header.chksum, ' ', sizeof(header.chksum));
  // Six octal digits, NUL, space.
  std::snprintf(header.chksum, 7, "%06o", compute_checksum(header) & 0777777);
  header.chksum[6] = '\0';
  header.chksum[7] = ' ';
}

std::string extract_string(const char *field, std::size_t field_size) {
  std::size_t len = 0;
  for (; len < field_size; ++len)
    if (field[len] == '\0')
      break;
  return std::string(field, len);
}

bool is_zero_block(const char *block) {
  for (std::size_t i = 0; i < block_size; ++i)
    if (block[i] != '\0')
      return false;
  return true;
}

} // namespace splittar::detail

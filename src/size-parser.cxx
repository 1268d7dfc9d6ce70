#include <splittar/error.hxx>
#include <splittar/size-parser.hxx>

#include <charconv>
#include <limits>
#include <string>
#include <system_error>

namespace splittar {
namespace {

constexpr std::int64_t kilo = 1000;
constexpr std::int64_t kibi = 1024;

bool is_digit(char c) { return c >= '0' && c <= '9'; }

} // unnamed namespace

std::int64_t size_multiplier(char suffix) noexcept {
  switch (suffix) {
  case 'b':
  case 'B':
    return 1;
  case 'k':
    return kilo;
  case 'K':
    return kibi;
  case 'm':
    return kilo * kilo;
  case 'M':
    return kibi * kibi;
  case 'g':
    return kilo * kilo * kilo;
  case 'G':
    return kibi * kibi * kibi;
  case 't':
    return kilo * kilo * kilo * kilo;
  case 'T':
    return kibi * kibi * kibi * kibi;
  case 'p':
    return kilo * kilo * kilo * kilo * kilo;
  case 'P':
    return kibi * kibi * kibi * kibi * kibi;
  default:
    return 0;
  }
}

std::int64_t parse_size(std::string_view expression) {
  using Reason = SizeParseError::Reason;

  if (expression.empty())
    throw SizeParseError(Reason::EmptyInput, "empty size");

  std::int64_t multiplier = 1;
  auto suffix = expression.back();
  if (!is_digit(suffix)) {
    expression.remove_suffix(1);
    multiplier = size_multiplier(suffix);
    if (multiplier == 0)
      throw SizeParseError(Reason::UnknownSuffix,
                           std::string("invalid size multiplier: ") + suffix);
  }

  std::int64_t value = 0;
  const auto *first = expression.data();
  const auto *last = first + expression.size();
  auto [ptr, ec] = std::from_chars(first, last, value, 10);
  if (expression.empty() || ec != std::errc() || ptr != last)
    throw SizeParseError(Reason::InvalidNumber,
                         "invalid size: \"" + std::string(expression) + "\"");

  if (value <= 0)
    throw SizeParseError(Reason::NotPositive,
                         "size must be greater than zero: " +
                             std::to_string(value));

  if (value > std::numeric_limits<std::int64_t>::max() / multiplier)
    throw SizeParseError(Reason::SizeOverflow,
                         "size overflows 64 bits: " + std::to_string(value) +
                             " * " + std::to_string(multiplier));

  return value * multiplier;
}

} // namespace splittar

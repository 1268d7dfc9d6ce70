#include <splittar/error.hxx>
#include <splittar/size-parser.hxx>

#include <cstdint>
#include <gtest/gtest.h>
#include <string>

using splittar::parse_size;
using splittar::SizeParseError;
using Reason = splittar::SizeParseError::Reason;

/**
 * @brief A size expression and the byte count it must produce.
 */
struct SizeCase {
  std::string expression;
  std::int64_t expected;
};

class ParseSizeTest : public ::testing::TestWithParam<SizeCase> {};

TEST_P(ParseSizeTest, ProducesExpectedBytes) {
  const auto &[expression, expected] = GetParam();
  EXPECT_EQ(parse_size(expression), expected) << "for \"" << expression << "\"";
}

INSTANTIATE_TEST_SUITE_P(
    SizeParser, ParseSizeTest,
    ::testing::Values(
        SizeCase{.expression = "1024", .expected = 1024},
        SizeCase{.expression = "1k", .expected = 1000},
        SizeCase{.expression = "1K", .expected = 1024},
        SizeCase{.expression = "2M", .expected = 2'097'152},
        SizeCase{.expression = "2m", .expected = 2'000'000},
        SizeCase{.expression = "3g", .expected = 3'000'000'000},
        SizeCase{.expression = "3G", .expected = 3LL << 30},
        SizeCase{.expression = "1t", .expected = 1'000'000'000'000},
        SizeCase{.expression = "1T", .expected = 1LL << 40},
        SizeCase{.expression = "2p", .expected = 2'000'000'000'000'000},
        SizeCase{.expression = "2P", .expected = 2LL << 50},
        SizeCase{.expression = "512b", .expected = 512},
        // Both byte suffixes mean one byte.
        SizeCase{.expression = "512B", .expected = 512},
        SizeCase{.expression = "0064M", .expected = 64LL << 20},
        SizeCase{.expression = "9223372036854775807",
                 .expected = INT64_MAX}));

/**
 * @brief A malformed size expression and the reason it must be rejected for.
 */
struct BadSizeCase {
  std::string expression;
  Reason reason;
};

class ParseSizeErrorTest : public ::testing::TestWithParam<BadSizeCase> {};

TEST_P(ParseSizeErrorTest, RejectsWithReason) {
  const auto &[expression, reason] = GetParam();
  try {
    parse_size(expression);
    FAIL() << "\"" << expression << "\" was accepted";
  } catch (const SizeParseError &e) {
    EXPECT_EQ(e.reason(), reason) << e.what();
  }
}

INSTANTIATE_TEST_SUITE_P(
    SizeParser, ParseSizeErrorTest,
    ::testing::Values(
        BadSizeCase{.expression = "", .reason = Reason::EmptyInput},
        BadSizeCase{.expression = "5x", .reason = Reason::UnknownSuffix},
        BadSizeCase{.expression = "5kb", .reason = Reason::InvalidNumber},
        BadSizeCase{.expression = "5 ", .reason = Reason::UnknownSuffix},
        BadSizeCase{.expression = "k", .reason = Reason::InvalidNumber},
        BadSizeCase{.expression = "1.5M", .reason = Reason::InvalidNumber},
        BadSizeCase{.expression = "12a4", .reason = Reason::InvalidNumber},
        BadSizeCase{.expression = "99999999999999999999",
                    .reason = Reason::InvalidNumber},
        BadSizeCase{.expression = "0", .reason = Reason::NotPositive},
        BadSizeCase{.expression = "0K", .reason = Reason::NotPositive},
        BadSizeCase{.expression = "-5", .reason = Reason::NotPositive},
        BadSizeCase{.expression = "-5M", .reason = Reason::NotPositive},
        BadSizeCase{.expression = "9000P", .reason = Reason::SizeOverflow},
        BadSizeCase{.expression = "9223372036854775807k",
                    .reason = Reason::SizeOverflow}));

TEST(SizeParser, ErrorsAreConfigErrors) {
  EXPECT_THROW(parse_size("0"), splittar::ConfigError);
  EXPECT_THROW(parse_size(""), splittar::ConfigError);
}

TEST(SizeParser, UnknownSuffixNamesTheSuffix) {
  try {
    parse_size("12q");
    FAIL();
  } catch (const SizeParseError &e) {
    EXPECT_NE(std::string(e.what()).find('q'), std::string::npos);
  }
}

TEST(SizeParser, MultiplierTableIsCaseSensitive) {
  EXPECT_EQ(splittar::size_multiplier('k'), 1000);
  EXPECT_EQ(splittar::size_multiplier('K'), 1024);
  EXPECT_EQ(splittar::size_multiplier('b'), splittar::size_multiplier('B'));
  EXPECT_EQ(splittar::size_multiplier('x'), 0);
}

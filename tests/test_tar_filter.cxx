#include "test-helpers.hxx"

#include <splittar/detail/tar-header.hxx>
#include <splittar/detail/tar-numeric.hxx>
#include <splittar/error.hxx>
#include <splittar/tar-filter.hxx>
#include <splittar/tar-writer.hxx>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/device/null.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/stream.hpp>

#include <algorithm>
#include <cstring>
#include <gtest/gtest.h>
#include <ios>
#include <string>
#include <vector>

namespace io = boost::iostreams;
using namespace splittar;
using splittar::detail::TarHeader;
using splittar::testing::extract;
using splittar::testing::fixed_header;
using splittar::testing::make_payload;
using splittar::testing::sha256sum;

namespace {

/**
 * @brief Write @p bodies as consecutive entries named 0, 1, ... to a string.
 */
std::string build_archive(const std::vector<std::string> &bodies) {
  std::string archive;
  {
    io::stream<io::back_insert_device<std::string>> out(archive);
    TarWriter tar(out);
    auto header = fixed_header();
    for (std::size_t i = 0; i < bodies.size(); ++i) {
      header.name = std::to_string(i);
      header.size = static_cast<std::int64_t>(bodies[i].size());
      tar.write_header(header);
      tar.write(bodies[i].data(), header.size);
    }
    tar.close();
  }
  return archive;
}

/**
 * @brief A bare header block followed by its padded body.
 */
std::string raw_entry(const std::string &name, char typeflag,
                      const std::string &body) {
  TarHeader tar;
  std::memset(&tar, 0, sizeof(tar));
  std::memcpy(tar.name, name.data(), std::min(name.size(), sizeof(tar.name)));
  detail::format_numeric(tar.mode, sizeof(tar.mode), 0755);
  detail::format_numeric(tar.uid, sizeof(tar.uid), 0);
  detail::format_numeric(tar.gid, sizeof(tar.gid), 0);
  detail::format_numeric(tar.size, sizeof(tar.size),
                         static_cast<std::int64_t>(body.size()));
  detail::format_numeric(tar.mtime, sizeof(tar.mtime), 0);
  tar.typeflag[0] = typeflag;
  std::memcpy(tar.magic, "ustar", 6);
  std::memcpy(tar.version, "00", 2);
  detail::seal_checksum(tar);

  std::string block(reinterpret_cast<const char *>(&tar), sizeof(tar));
  block += body;
  block.append(detail::padding_for(body.size()), '\0');
  return block;
}

} // namespace

/**
 * @brief Entry bodies to archive and the filter buffer sizes to read them
 * back with.
 */
struct RoundTripCase {
  std::vector<std::size_t> body_sizes;
  std::vector<std::streamsize> tar_filter_buffer_sizes;
};

class TarFilterRoundTripTest : public ::testing::TestWithParam<RoundTripCase> {
};

TEST_P(TarFilterRoundTripTest, ExtractedPayloadMatchesInput) {
  const auto &[body_sizes, buffer_sizes] = GetParam();

  std::vector<std::string> bodies;
  std::string expected;
  for (auto size : body_sizes) {
    bodies.push_back(make_payload(size));
    expected += bodies.back();
  }
  auto const archive = build_archive(bodies);
  auto const expected_hash = sha256sum(expected);

  for (const auto buffer_size : buffer_sizes) {
    io::filtering_istream in;
    in.push(TarFilter<>(buffer_size));
    in.push(io::array_source(archive.data(), archive.size()));

    const auto hash = sha256sum(in);
    EXPECT_EQ(hash, expected_hash) << "Expected " << expected_hash
                                   << " but got " << hash << " with buffer "
                                   << buffer_size;
  }
}

INSTANTIATE_TEST_SUITE_P(
    TarFilterTests, TarFilterRoundTripTest,
    ::testing::Values(
        RoundTripCase{.body_sizes = {5},
                      .tar_filter_buffer_sizes =
                          {io::default_device_buffer_size, 16'384, 1}},
        RoundTripCase{.body_sizes = {4096, 4096, 100},
                      .tar_filter_buffer_sizes =
                          {io::default_device_buffer_size, 16'384, 1}},
        RoundTripCase{.body_sizes = {0, 511, 0, 513},
                      .tar_filter_buffer_sizes =
                          {io::default_device_buffer_size, 16'384, 1}},
        RoundTripCase{.body_sizes = {300'000},
                      .tar_filter_buffer_sizes = {
                          io::default_device_buffer_size, 16'384, 7}}));

TEST(TarFilter, ObserverSeesDecodedMetadata) {
  auto const archive = build_archive({"hello", "world!"});
  auto const extracted = extract(archive, 1);

  EXPECT_EQ(extracted.payload, "helloworld!");
  ASSERT_EQ(extracted.entries.size(), 2u);

  const auto &first = extracted.entries[0];
  EXPECT_EQ(first.name, "0");
  EXPECT_EQ(first.size, 5);
  EXPECT_EQ(first.mode, 0444u);
  EXPECT_EQ(first.uid, 1000);
  EXPECT_EQ(first.gid, 1000);
  EXPECT_EQ(first.uname, "builder");
  EXPECT_EQ(first.gname, "staff");
  EXPECT_DOUBLE_EQ(first.mtime, 1'700'000'000.25);
  EXPECT_DOUBLE_EQ(first.atime, 1'700'000'000.25);
  EXPECT_DOUBLE_EQ(first.ctime, 1'700'000'000.25);
  EXPECT_EQ(first.pax_records.count("atime"), 1u);

  EXPECT_EQ(extracted.entries[1].name, "1");
  EXPECT_EQ(extracted.entries[1].size, 6);
}

TEST(TarFilter, XattrsTravelAsPaxRecords) {
  std::string archive;
  {
    io::stream<io::back_insert_device<std::string>> out(archive);
    TarWriter tar(out);
    auto header = fixed_header();
    header.name = "tagged";
    header.xattrs["user.origin"] = "sensor-7";
    tar.write_header(header);
    tar.close();
  }

  auto const extracted = extract(archive);
  ASSERT_EQ(extracted.entries.size(), 1u);
  EXPECT_EQ(extracted.entries[0].pax_records.at("SCHILY.xattr.user.origin"),
            "sensor-7");
}

TEST(TarFilter, SkipsBodiesOfNonRegularEntries) {
  auto archive = raw_entry("global", detail::typeflag::pax_global,
                           "22 comment=not a file\n");
  archive += raw_entry("dir/", '5', "");
  archive += raw_entry("weird-dir/", '5', std::string(700, 'D'));
  archive += build_archive({"payload"});

  for (std::streamsize buffer_size : {io::default_device_buffer_size,
                                      std::streamsize(1)}) {
    auto const extracted = extract(archive, buffer_size);
    EXPECT_EQ(extracted.payload, "payload");
    ASSERT_EQ(extracted.entries.size(), 1u);
    EXPECT_EQ(extracted.entries[0].name, "0");
  }
}

TEST(TarFilter, AcceptsOldStyleRegularEntries) {
  auto archive = raw_entry("legacy", detail::typeflag::regular_old, "abc");
  archive.append(1024, '\0');

  auto const extracted = extract(archive);
  EXPECT_EQ(extracted.payload, "abc");
  ASSERT_EQ(extracted.entries.size(), 1u);
  EXPECT_EQ(extracted.entries[0].name, "legacy");
  EXPECT_EQ(extracted.entries[0].mode, 0755u);
}

TEST(TarFilter, RejectsChecksumMismatch) {
  auto archive = build_archive({"hello"});
  // First byte of the ustar entry name, after the pax header and its records.
  archive[1024] ^= 0x01;

  io::filtering_istream in;
  in.push(TarFilter<>());
  in.push(io::array_source(archive.data(), archive.size()));
  EXPECT_THROW(io::copy(in, io::null_sink()), ArchiveFormatError);
}

TEST(TarFilter, StopsAtFirstZeroBlock) {
  auto archive = build_archive({"kept"});
  archive += build_archive({"ignored"});

  auto const extracted = extract(archive);
  EXPECT_EQ(extracted.payload, "kept");
  EXPECT_EQ(extracted.entries.size(), 1u);
}

#include "test-helpers.hxx"

#include <splittar/detail/tar-header.hxx>
#include <splittar/detail/tar-numeric.hxx>
#include <splittar/error.hxx>
#include <splittar/tar-writer.hxx>

#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/stream.hpp>

#include <chrono>
#include <cstring>
#include <gtest/gtest.h>
#include <string>

namespace io = boost::iostreams;
using namespace splittar;
using splittar::detail::TarHeader;
using splittar::testing::fixed_header;

namespace {

/**
 * @brief Fixture owning an in-memory archive and a writer over it.
 */
class TarWriterTest : public ::testing::Test {
protected:
  std::string archive;
  io::stream<io::back_insert_device<std::string>> out{archive};
  TarWriter tar{out};

  void add(const std::string &name, const std::string &body) {
    auto header = fixed_header();
    header.name = name;
    header.size = static_cast<std::int64_t>(body.size());
    tar.write_header(header);
    ASSERT_EQ(tar.write(body.data(), header.size), header.size);
  }

  const TarHeader *header_at(std::size_t offset) const {
    return reinterpret_cast<const TarHeader *>(archive.data() + offset);
  }
};

} // namespace

TEST_F(TarWriterTest, EmptyArchiveIsTwoZeroBlocks) {
  tar.close();
  ASSERT_EQ(archive.size(), 1024u);
  EXPECT_TRUE(detail::is_zero_block(archive.data()));
  EXPECT_TRUE(detail::is_zero_block(archive.data() + 512));
}

TEST_F(TarWriterTest, WritesPaxThenUstarHeaderThenPaddedBody) {
  add("00000000", "hello");
  tar.close();

  // pax header, one block of records, ustar header, one body block, trailer.
  ASSERT_EQ(archive.size(), 512u * 6);

  auto pax = header_at(0);
  EXPECT_EQ(pax->typeflag[0], 'x');
  EXPECT_EQ(detail::extract_string(pax->name, sizeof(pax->name)),
            "PaxHeaders.0/00000000");
  auto const records = std::string(archive.data() + 512,
                                   detail::parse_octal(pax->size, 12));
  EXPECT_NE(records.find("atime=1700000000.25\n"), std::string::npos);
  EXPECT_NE(records.find("ctime=1700000000.25\n"), std::string::npos);
  EXPECT_NE(records.find("mtime=1700000000.25\n"), std::string::npos);

  auto entry = header_at(1024);
  EXPECT_EQ(entry->typeflag[0], '0');
  EXPECT_EQ(std::memcmp(entry->magic, "ustar", 6), 0);
  EXPECT_EQ(std::memcmp(entry->version, "00", 2), 0);
  EXPECT_EQ(detail::extract_string(entry->name, sizeof(entry->name)),
            "00000000");
  EXPECT_EQ(std::string(entry->mode, 8), std::string("0000444\0", 8));
  EXPECT_EQ(detail::parse_octal(entry->size, sizeof(entry->size)), 5);
  EXPECT_EQ(detail::parse_octal(entry->uid, sizeof(entry->uid)), 1000);
  EXPECT_EQ(detail::parse_octal(entry->mtime, sizeof(entry->mtime)),
            1'700'000'000);
  EXPECT_EQ(detail::extract_string(entry->uname, sizeof(entry->uname)),
            "builder");
  EXPECT_EQ(detail::extract_string(entry->gname, sizeof(entry->gname)),
            "staff");
  EXPECT_EQ(detail::parse_octal(entry->chksum, sizeof(entry->chksum)),
            static_cast<std::int64_t>(detail::compute_checksum(*entry)));

  EXPECT_EQ(archive.substr(1536, 5), "hello");
  EXPECT_EQ(archive.substr(1541, 507), std::string(507, '\0'));
}

TEST_F(TarWriterTest, BodyOfExactBlockSizeHasNoPadding) {
  add("a", std::string(512, 'z'));
  tar.close();
  EXPECT_EQ(archive.size(), 512u * 6);
}

TEST_F(TarWriterTest, LongNameIsCarriedInPaxPath) {
  std::string long_name(150, 'n');
  add(long_name, "x");
  tar.close();

  auto const extracted = splittar::testing::extract(archive);
  ASSERT_EQ(extracted.entries.size(), 1u);
  EXPECT_EQ(extracted.entries[0].name, long_name);
  EXPECT_EQ(detail::extract_string(header_at(1024)->name, 100),
            long_name.substr(0, 100));
}

TEST_F(TarWriterTest, OversizedIdsUseBase256AndPax) {
  auto header = fixed_header();
  header.name = "big-ids";
  header.uid = 3'000'000;
  header.gid = 4'000'000;
  header.size = 0;
  tar.write_header(header);
  tar.close();

  auto entry = header_at(1024);
  EXPECT_NE(static_cast<unsigned char>(entry->uid[0]) & 0x80, 0);
  EXPECT_EQ(detail::parse_numeric(entry->uid, sizeof(entry->uid)), 3'000'000);

  auto const extracted = splittar::testing::extract(archive);
  ASSERT_EQ(extracted.entries.size(), 1u);
  EXPECT_EQ(extracted.entries[0].uid, 3'000'000);
  EXPECT_EQ(extracted.entries[0].gid, 4'000'000);
}

TEST_F(TarWriterTest, TimesBeforeEpochKeepTheirSign) {
  auto header = fixed_header();
  header.name = "old";
  header.mtime = EntryHeader::time_point(std::chrono::milliseconds(-1500));
  header.atime = EntryHeader::time_point(std::chrono::milliseconds(-250));
  header.ctime = EntryHeader::time_point(std::chrono::seconds(-3));
  tar.write_header(header);
  tar.close();

  auto pax = header_at(0);
  auto const records = std::string(archive.data() + 512,
                                   detail::parse_octal(pax->size, 12));
  EXPECT_NE(records.find("mtime=-1.5\n"), std::string::npos) << records;
  EXPECT_NE(records.find("atime=-0.25\n"), std::string::npos) << records;
  EXPECT_NE(records.find("ctime=-3\n"), std::string::npos) << records;

  auto entry = header_at(1024);
  EXPECT_EQ(detail::parse_numeric(entry->mtime, sizeof(entry->mtime)), -2);

  auto const extracted = splittar::testing::extract(archive);
  ASSERT_EQ(extracted.entries.size(), 1u);
  EXPECT_DOUBLE_EQ(extracted.entries[0].mtime, -1.5);
  EXPECT_DOUBLE_EQ(extracted.entries[0].atime, -0.25);
  EXPECT_DOUBLE_EQ(extracted.entries[0].ctime, -3);
}

TEST_F(TarWriterTest, RejectsWritingPastDeclaredSize) {
  auto header = fixed_header();
  header.name = "small";
  header.size = 2;
  tar.write_header(header);
  EXPECT_THROW(tar.write("abc", 3), ArchiveFormatError);
  EXPECT_EQ(tar.write("ab", 2), 2);
}

TEST_F(TarWriterTest, RejectsHeaderBeforePreviousBodyIsComplete) {
  auto header = fixed_header();
  header.name = "first";
  header.size = 10;
  tar.write_header(header);
  tar.write("12345", 5);
  EXPECT_EQ(tar.remaining(), 5);

  header.name = "second";
  EXPECT_THROW(tar.write_header(header), ArchiveFormatError);
  EXPECT_THROW(tar.close(), ArchiveFormatError);
}

TEST_F(TarWriterTest, CloseIsIdempotentAndFinal) {
  add("only", "data");
  tar.close();
  auto const size = archive.size();
  tar.close();
  EXPECT_EQ(archive.size(), size);
  EXPECT_TRUE(tar.closed());
  EXPECT_THROW(tar.write_header(fixed_header()), ArchiveFormatError);
}

TEST(TarWriter, ReportsShortBodyWrites) {
  splittar::testing::ShortWriteBuffer buffer(1024);
  std::ostream out(&buffer);
  TarWriter tar(out);

  auto header = fixed_header();
  header.name = "chunk";
  header.size = 4096;
  tar.write_header(header);

  std::string body(4096, 'q');
  EXPECT_EQ(tar.write(body.data(), 4096), 1024);
  EXPECT_EQ(tar.remaining(), 3072);
}

TEST(TarWriter, StreamFailuresSurfaceAsIosFailure) {
  splittar::testing::FailingWriteBuffer buffer(100);
  std::ostream out(&buffer);
  TarWriter tar(out);

  auto header = fixed_header();
  header.name = "doomed";
  header.size = 1;
  EXPECT_THROW(tar.write_header(header), std::ios_base::failure);
}

TEST(TarNumeric, FormatsOctalAndBase256) {
  char field[12];
  detail::format_numeric(field, sizeof(field), 5);
  EXPECT_EQ(std::string(field, 12), std::string("00000000005\0", 12));

  detail::format_numeric(field, sizeof(field), detail::max_octal(12));
  EXPECT_EQ(detail::parse_numeric(field, 12), 8'589'934'591);
  EXPECT_EQ(field[0], '7');

  auto const huge = std::int64_t(1) << 40;
  detail::format_numeric(field, sizeof(field), huge);
  EXPECT_NE(static_cast<unsigned char>(field[0]) & 0x80, 0);
  EXPECT_EQ(detail::parse_numeric(field, 12), huge);
}

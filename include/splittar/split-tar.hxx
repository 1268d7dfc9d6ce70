/**
 * @file split-tar.hxx
 * @brief Split any Boost.Iostreams source into size-bounded tar entries.
 */

#pragma once

#include <splittar/detail/base-split-tar-impl.hxx>
#include <splittar/entry-header.hxx>
#include <splittar/error.hxx>
#include <splittar/split-options.hxx>
#include <splittar/tar-writer.hxx>

#include <boost/iostreams/read.hpp>

#include <exception>
#include <string>
#include <utility>

namespace splittar {

/**
 * @brief Read @p source to its end and write it to @p target as consecutive
 * entries of at most options.chunk_size bytes, then finalize the archive.
 *
 * Source is anything boost::iostreams::read() accepts: a Source device such
 * as file_descriptor_source or array_source, or a std::istream. End of stream
 * is the -1 such reads return; exceptions thrown by the source are reported
 * as SourceReadError.
 *
 * The source is neither closed nor rewound. On success the archive trailer is
 * written and @p target is flushed; on failure the archive is left
 * unfinalized.
 *
 * @code{.cpp}
 * namespace io = boost::iostreams;
 *
 * io::file_descriptor_source source("big.bin", std::ios::binary);
 * io::stream<io::file_descriptor_sink> out("big.tar");
 * splittar::TarWriter tar(out);
 * auto summary = splittar::split_tar(source, tar, {.chunk_size = 1 << 20});
 * @endcode
 *
 * @throws ConfigError if @p options are invalid (before any I/O).
 * @throws SourceReadError, TargetWriteError, CloseError.
 */
template <typename Source>
SplitSummary split_tar(Source &source, TarWriter &target,
                       const SplitOptions &options,
                       EntryHeader header_template) {
  validate(options);

  detail::BaseSplitTarImpl impl(options, std::move(header_template));
  auto summary = impl.run(
      [&source](char *s, std::streamsize n) {
        return boost::iostreams::read(source, s, n);
      },
      target);

  try {
    target.close();
  } catch (const std::exception &e) {
    std::throw_with_nested(
        CloseError(std::string("failed to finalize archive: ") + e.what()));
  }
  return summary;
}

/**
 * @brief split_tar() with a header template for the current user and time.
 */
template <typename Source>
SplitSummary split_tar(Source &source, TarWriter &target,
                       const SplitOptions &options) {
  validate(options);
  return split_tar(source, target, options, make_header_template());
}

} // namespace splittar

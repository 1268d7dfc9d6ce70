#include <splittar/detail/base-split-tar-impl.hxx>
#include <splittar/error.hxx>

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <exception>
#include <new>
#include <string>
#include <utility>

namespace splittar::detail {

BaseSplitTarImpl::BaseSplitTarImpl(SplitOptions options,
                                   EntryHeader header_template)
    : options(std::move(options)), header(std::move(header_template)) {}

/**
 * @brief Fill the buffer up to the chunk size or the end of the source.
 *
 * Only an explicit end of stream leaves the loop early; a read returning zero
 * bytes is retried.
 */
void BaseSplitTarImpl::fill(const read_function &read) {
  while (!end_of_stream && fill_offset < buffer.size()) {
    auto const wanted =
        static_cast<std::streamsize>(buffer.size() - fill_offset);
    BOOST_LOG_TRIVIAL(trace)
        << "attempt reading " << wanted << " bytes from source";
    std::streamsize n;
    try {
      n = read(buffer.data() + fill_offset, wanted);
    } catch (const std::exception &e) {
      std::throw_with_nested(SourceReadError(
          std::string("failed to read next chunk from source: ") + e.what()));
    }
    if (n < 0) {
      end_of_stream = true;
      break;
    }
    BOOST_LOG_TRIVIAL(trace) << "actually read " << n << " bytes from source";
    fill_offset += static_cast<std::size_t>(n);
  }

  // An exhausted source with nothing buffered is a clean end of the run.
  state = fill_offset == 0 ? State::Done : State::Flushing;
}

void BaseSplitTarImpl::write_body(const std::string &name, TarWriter &target) {
  std::size_t written = 0;
  while (written < fill_offset) {
    auto const wanted = static_cast<std::streamsize>(fill_offset - written);
    std::streamsize n;
    try {
      n = target.write(buffer.data() + written, wanted);
    } catch (const std::exception &e) {
      std::throw_with_nested(TargetWriteError(
          name, "failed to write chunk " + name + " to archive: " + e.what()));
    }

    if (n != wanted) {
      if (options.short_write_policy == ShortWritePolicy::Fail || n <= 0)
        throw ShortWriteError(name, static_cast<std::int64_t>(fill_offset),
                              static_cast<std::int64_t>(written) +
                                  std::max<std::streamsize>(n, 0));
      BOOST_LOG_TRIVIAL(warning)
          << "bytes written to archive (" << n
          << ") do not equal expected count (" << wanted << ") for " << name
          << ", writing the remainder";
    }
    written += static_cast<std::size_t>(n);
  }
}

void BaseSplitTarImpl::flush(TarWriter &target) {
  auto const name = entry_name(options, chunk_index);
  header.name = name;
  header.size = static_cast<std::int64_t>(fill_offset);

  BOOST_LOG_TRIVIAL(debug) << "writing header for " << name << " ("
                           << header.size << " bytes)";
  try {
    target.write_header(header);
  } catch (const std::exception &e) {
    std::throw_with_nested(TargetWriteError(
        name, "failed to write header " + name + " to archive: " + e.what()));
  }
  write_body(name, target);

  ++summary.entries;
  summary.bytes += header.size;
  ++chunk_index;
  fill_offset = 0;
  state = State::Reading;
}

SplitSummary BaseSplitTarImpl::run(const read_function &read,
                                   TarWriter &target) {
  try {
    buffer.resize(static_cast<std::size_t>(options.chunk_size));
  } catch (const std::bad_alloc &) {
    std::throw_with_nested(
        ConfigError("cannot allocate a chunk buffer of " +
                    std::to_string(options.chunk_size) + " bytes"));
  }

  while (state != State::Done) {
    switch (state) {
    case State::Reading:
      fill(read);
      break;
    case State::Flushing:
      flush(target);
      break;
    case State::Done:
      break;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "split " << summary.bytes << " bytes into "
                          << summary.entries << " entries";
  return summary;
}
} // namespace splittar::detail

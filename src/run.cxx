#include <splittar/error.hxx>
#include <splittar/run.hxx>
#include <splittar/split-tar.hxx>
#include <splittar/tar-filter.hxx>
#include <splittar/tar-writer.hxx>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/device/null.hpp>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/log/trivial.hpp>

#include <exception>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace splittar {
namespace {

namespace io = boost::iostreams;

io::file_descriptor_flags close_flag(Ownership ownership) {
  return ownership == Ownership::Close ? io::close_handle
                                       : io::never_close_handle;
}

io::file_descriptor_source open_source(const Endpoint &endpoint) {
  try {
    if (endpoint.is_standard_stream())
      return io::file_descriptor_source(STDIN_FILENO, io::never_close_handle);
    if (endpoint.is_path())
      return io::file_descriptor_source(endpoint.path,
                                        std::ios::in | std::ios::binary);
    return io::file_descriptor_source(endpoint.descriptor,
                                      close_flag(endpoint.ownership));
  } catch (const std::exception &e) {
    std::throw_with_nested(OpenError("failed to open source " +
                                     endpoint.display_name(true) + ": " +
                                     e.what()));
  }
}

io::file_descriptor_sink open_target(const Endpoint &endpoint) {
  try {
    if (endpoint.is_standard_stream())
      return io::file_descriptor_sink(STDOUT_FILENO, io::never_close_handle);
    if (endpoint.is_path())
      return io::file_descriptor_sink(endpoint.path, std::ios::out |
                                                         std::ios::trunc |
                                                         std::ios::binary);
    return io::file_descriptor_sink(endpoint.descriptor,
                                    close_flag(endpoint.ownership));
  } catch (const std::exception &e) {
    std::throw_with_nested(OpenError("failed to open target " +
                                     endpoint.display_name(false) + ": " +
                                     e.what()));
  }
}

std::string message_of(const std::exception_ptr &failure) {
  try {
    std::rethrow_exception(failure);
  } catch (const std::exception &e) {
    return describe(e);
  }
  return {};
}

/**
 * @brief Turn a close failure into a CloseError, keeping any earlier failure.
 */
std::exception_ptr close_failure(const std::string &what,
                                 const std::exception &error,
                                 std::exception_ptr primary) {
  auto message = "failed to close " + what + ": " + describe(error);
  if (primary)
    message = message_of(primary) + "; additionally " + message;
  return std::make_exception_ptr(CloseError(message, std::move(primary)));
}

/**
 * @brief Split into an already opened sink and close it.
 */
SplitSummary write_archive(io::file_descriptor_source &source,
                           io::file_descriptor_sink &sink,
                           const SplitOptions &options, EntryHeader header,
                           const std::string &target_name) {
  io::stream<io::file_descriptor_sink> out(sink);
  TarWriter tar(out);

  std::exception_ptr failure;
  SplitSummary summary;
  try {
    summary = split_tar(source, tar, options, std::move(header));
  } catch (const std::exception &) {
    failure = std::current_exception();
  }

  try {
    out.close();
  } catch (const std::exception &e) {
    failure = close_failure("target " + target_name, e, failure);
  }

  if (failure)
    std::rethrow_exception(failure);
  return summary;
}

} // unnamed namespace

Endpoint Endpoint::from_path(std::string path) {
  Endpoint endpoint;
  endpoint.path = path.empty() ? "-" : std::move(path);
  endpoint.ownership = Ownership::Close;
  return endpoint;
}

Endpoint Endpoint::from_descriptor(int descriptor, Ownership ownership) {
  Endpoint endpoint;
  endpoint.descriptor = descriptor;
  endpoint.ownership = ownership;
  return endpoint;
}

std::string Endpoint::display_name(bool input) const {
  if (is_standard_stream())
    return input ? "stdin" : "stdout";
  if (is_path())
    return path;
  return "fd" + std::to_string(descriptor);
}

std::int64_t effective_chunk_size(int descriptor, std::int64_t chunk_size) {
  struct stat st;
  if (::fstat(descriptor, &st) != 0 || !S_ISREG(st.st_mode))
    return chunk_size;
  if (st.st_size > 0 && st.st_size < chunk_size) {
    BOOST_LOG_TRIVIAL(debug) << "source is only " << st.st_size
                             << " bytes, reducing chunk size from "
                             << chunk_size;
    return st.st_size;
  }
  return chunk_size;
}

std::string default_base_name(const Endpoint &source) {
  if (source.is_standard_stream())
    return "stdin";
  if (source.is_path()) {
    // "logs/" names the directory "logs".
    auto path = std::filesystem::path(source.path);
    while (path.filename().empty() && path.has_relative_path()) {
      auto parent = path.parent_path();
      if (parent == path)
        break;
      path = std::move(parent);
    }
    auto name = path.filename().string();
    if (!name.empty())
      return name;
  }
  return source.display_name(true);
}

SplitSummary scan_archive(const std::string &path) {
  SplitSummary summary;
  io::filtering_istream in;
  in.push(TarFilter<>([&summary](const TarEntryInfo &) { ++summary.entries; }));
  in.push(io::file_source(path, std::ios::in | std::ios::binary));
  if (!in.component<io::file_source>(1)->is_open())
    throw OpenError("failed to open archive " + path);

  summary.bytes = io::copy(in, io::null_sink());
  return summary;
}

SplitSummary run(const RunConfig &config) {
  auto options = config.split;
  if (options.naming == EntryNaming::BaseName && options.base_name.empty())
    options.base_name = default_base_name(config.source);
  validate(options);

  auto source = open_source(config.source);
  options.chunk_size =
      effective_chunk_size(source.handle(), options.chunk_size);

  auto header = config.header_template ? *config.header_template
                                       : make_header_template();
  auto const target_name = config.target.display_name(false);

  std::exception_ptr failure;
  SplitSummary summary;
  try {
    auto sink = open_target(config.target);
    summary = write_archive(source, sink, options, std::move(header),
                            target_name);
  } catch (const std::exception &) {
    failure = std::current_exception();
  }

  try {
    source.close();
  } catch (const std::exception &e) {
    failure = close_failure("source " + config.source.display_name(true), e,
                            failure);
  }

  if (failure)
    std::rethrow_exception(failure);

  BOOST_LOG_TRIVIAL(info) << "wrote " << summary.entries << " entries ("
                          << summary.bytes << " bytes) to " << target_name;

  if (config.verify) {
    if (!config.target.is_path() || config.target.is_standard_stream()) {
      BOOST_LOG_TRIVIAL(warning)
          << "cannot verify " << target_name << ", it is not a file path";
    } else {
      auto const found = scan_archive(config.target.path);
      if (found.entries != summary.entries || found.bytes != summary.bytes)
        throw ArchiveFormatError(
            "verification of " + target_name + " failed: expected " +
            std::to_string(summary.entries) + " entries and " +
            std::to_string(summary.bytes) + " bytes, found " +
            std::to_string(found.entries) + " entries and " +
            std::to_string(found.bytes) + " bytes");
      BOOST_LOG_TRIVIAL(info) << "verified " << target_name;
    }
  }
  return summary;
}

} // namespace splittar

/**
 * @file tar-filter.hxx
 * @brief Defines a TAR filter that extracts file content from a tar stream
 * using Boost.Iostreams.
 */

#pragma once

#include <splittar/detail/tar-filter-impl.hxx>
#include <splittar/tar-entry-info.hxx>
#include <boost/iostreams/filter/symmetric.hpp>

namespace splittar {
/**
 * @brief Boost.Iostreams-compatible symmetric filter that extracts file
 * contents from a TAR archive stream.
 *
 * Reading an archive written by TarWriter through this filter yields the
 * concatenated chunk bodies in archive order, which is how the round trip of
 * a split is checked. An optional observer sees each entry's metadata.
 *
 * @tparam Alloc Allocator type for internal buffers (default:
 * std::allocator<char>)
 *
 * @code{.cpp}
 * namespace io = boost::iostreams;
 *
 * std::vector<splittar::TarEntryInfo> entries;
 * io::filtering_istream in;
 * in.push(splittar::TarFilter<>(
 *     [&](const splittar::TarEntryInfo &e) { entries.push_back(e); }));
 * in.push(io::file_source("chunks.tar", std::ios::binary));
 *
 * std::string payload((std::istreambuf_iterator<char>(in)),
 *                     std::istreambuf_iterator<char>());
 * @endcode
 *
 * @note The filter is stateful and maintains internal parsing state. Copies of
 * the filter share that state.
 */
template <typename Alloc = std::allocator<char>>
struct TarFilter
    : boost::iostreams::symmetric_filter<detail::TarFilterImpl<Alloc>, Alloc> {
private:
  using impl_type = detail::TarFilterImpl<Alloc>;
  using base_type = boost::iostreams::symmetric_filter<impl_type, Alloc>;

public:
  /// Character type used by the stream.
  using char_type = typename base_type::char_type;
  /// Filter category for Boost.Iostreams.
  using category = typename base_type::category;

  /**
   * @brief Constructs the TAR filter with optional buffer size.
   *
   * @param buffer_size Buffer size used internally (defaults to
   * Boost.Iostreams' default size).
   */
  explicit TarFilter(std::streamsize buffer_size =
                         boost::iostreams::default_device_buffer_size)
      : base_type(buffer_size) {}

  /**
   * @brief Constructs the TAR filter reporting every regular entry.
   *
   * @param observer Invoked with each entry's metadata before its body.
   * @param buffer_size Buffer size used internally.
   */
  explicit TarFilter(const TarEntryObserver &observer,
                     std::streamsize buffer_size =
                         boost::iostreams::default_device_buffer_size)
      : base_type(buffer_size, observer) {}
};

/// @brief Makes TarFilter pipable in Boost.Iostreams pipelines.
BOOST_IOSTREAMS_PIPABLE(TarFilter<>, 0);
} // namespace splittar

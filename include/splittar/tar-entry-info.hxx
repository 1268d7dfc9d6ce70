#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace splittar {

/**
 * @struct TarEntryInfo
 * @brief Metadata of one regular-file entry as decoded from an archive.
 *
 * Values from a preceding pax extended header take precedence over the ustar
 * fields. Times are seconds since the epoch; pax times keep their fraction.
 */
struct TarEntryInfo {
  std::string name;
  std::int64_t size = 0;
  std::uint32_t mode = 0;
  std::int64_t uid = 0;
  std::int64_t gid = 0;
  std::string uname;
  std::string gname;
  double mtime = 0;
  double atime = 0; /**< @brief 0 when the archive does not record it. */
  double ctime = 0; /**< @brief 0 when the archive does not record it. */
  std::map<std::string, std::string> pax_records;
};

/** @brief Callback invoked for every regular entry, before its body. */
using TarEntryObserver = std::function<void(const TarEntryInfo &)>;

} // namespace splittar

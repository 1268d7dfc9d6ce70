/**
 * @file entry-header.hxx
 * @brief Archive entry metadata and the per-run header template.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace splittar {

/** @brief Kind of archive entry. Chunks are always regular files. */
enum class EntryType { Regular };

/** @brief Permission bits of every chunk entry (r--r--r--). */
inline constexpr std::uint32_t chunk_mode = 0444;

/**
 * @struct EntryHeader
 * @brief Metadata written before one entry body.
 *
 * Within a run only name and size change between entries; every other field
 * comes from the template built by make_header_template().
 */
struct EntryHeader {
  using time_point = std::chrono::system_clock::time_point;

  EntryType type = EntryType::Regular;
  std::string name;      /**< @brief Entry path inside the archive. */
  std::int64_t size = 0; /**< @brief Exact number of body bytes. */
  std::uint32_t mode = chunk_mode;
  std::int64_t uid = 0;
  std::int64_t gid = 0;
  std::string uname;
  std::string gname;
  time_point mtime;
  time_point atime;
  time_point ctime;
  std::uint32_t devmajor = 0;
  std::uint32_t devminor = 0;
  std::map<std::string, std::string> xattrs;
};

/**
 * @struct HostIdentity
 * @brief Owner information stamped onto every entry.
 */
struct HostIdentity {
  std::int64_t uid = 0;
  std::int64_t gid = 0;
  std::string uname;
  std::string gname;
};

/** @brief Identity used when the user lookup fails. */
HostIdentity fallback_identity();

/**
 * @struct IdentityLookup
 * @brief Host identity services, replaceable for tests.
 *
 * current_user returns the effective user with its primary group id filled in
 * and gname left empty; group_name resolves a gid. Either returns
 * std::nullopt on failure.
 */
struct IdentityLookup {
  std::function<std::optional<HostIdentity>()> current_user;
  std::function<std::optional<std::string>(std::int64_t gid)> group_name;

  /** @brief Lookup backed by getpwuid_r(3) and getgrgid_r(3). */
  static IdentityLookup system();
};

/**
 * @brief Resolve the invoking user's identity, degrading instead of failing.
 *
 * A failed user lookup yields fallback_identity(); a failed group lookup
 * keeps the gid and names the group "unknown". Each fallback logs a warning.
 */
HostIdentity resolve_identity(const IdentityLookup &lookup);

/**
 * @brief Build the header template for one run.
 *
 * @param identity Owner fields for every entry.
 * @param now Instant used for mtime, atime and ctime.
 * @return EntryHeader A regular-file header with empty name and zero size.
 */
EntryHeader make_header_template(const HostIdentity &identity,
                                 EntryHeader::time_point now);

/**
 * @brief Build the header template from the system identity and clock.
 */
EntryHeader make_header_template();

} // namespace splittar

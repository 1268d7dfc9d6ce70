#include <splittar/entry-header.hxx>

#include <boost/log/trivial.hpp>

#include <cerrno>
#include <cstring>
#include <grp.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace splittar {
namespace {

constexpr std::int64_t sentinel_id = 999;
constexpr const char *unknown_name = "unknown";

/**
 * @brief Initial buffer size for the reentrant passwd/group lookups.
 */
std::size_t lookup_buffer_size(int name) {
  auto size = ::sysconf(name);
  return size > 0 ? static_cast<std::size_t>(size) : 16'384;
}

std::optional<HostIdentity> lookup_current_user() {
  std::vector<char> buffer(lookup_buffer_size(_SC_GETPW_R_SIZE_MAX));
  struct passwd pwd;
  struct passwd *result = nullptr;
  int rc;
  while ((rc = ::getpwuid_r(::geteuid(), &pwd, buffer.data(), buffer.size(),
                            &result)) == ERANGE)
    buffer.resize(buffer.size() * 2);

  if (rc != 0 || result == nullptr) {
    BOOST_LOG_TRIVIAL(debug)
        << "getpwuid_r failed: " << (rc ? std::strerror(rc) : "no entry");
    return std::nullopt;
  }

  HostIdentity identity;
  identity.uid = result->pw_uid;
  identity.gid = result->pw_gid;
  identity.uname = result->pw_name;
  return identity;
}

std::optional<std::string> lookup_group_name(std::int64_t gid) {
  std::vector<char> buffer(lookup_buffer_size(_SC_GETGR_R_SIZE_MAX));
  struct group grp;
  struct group *result = nullptr;
  int rc;
  while ((rc = ::getgrgid_r(static_cast<gid_t>(gid), &grp, buffer.data(),
                            buffer.size(), &result)) == ERANGE)
    buffer.resize(buffer.size() * 2);

  if (rc != 0 || result == nullptr) {
    BOOST_LOG_TRIVIAL(debug)
        << "getgrgid_r failed: " << (rc ? std::strerror(rc) : "no entry");
    return std::nullopt;
  }
  return std::string(result->gr_name);
}

} // unnamed namespace

HostIdentity fallback_identity() {
  return HostIdentity{.uid = sentinel_id,
                      .gid = sentinel_id,
                      .uname = unknown_name,
                      .gname = unknown_name};
}

IdentityLookup IdentityLookup::system() {
  return IdentityLookup{.current_user = lookup_current_user,
                        .group_name = lookup_group_name};
}

HostIdentity resolve_identity(const IdentityLookup &lookup) {
  std::optional<HostIdentity> user;
  if (lookup.current_user)
    user = lookup.current_user();
  if (!user) {
    BOOST_LOG_TRIVIAL(warning)
        << "failed to get current user, using uid/gid " << sentinel_id;
    return fallback_identity();
  }

  std::optional<std::string> group;
  if (lookup.group_name)
    group = lookup.group_name(user->gid);
  if (group) {
    user->gname = std::move(*group);
  } else {
    BOOST_LOG_TRIVIAL(warning) << "failed to look up gid " << user->gid;
    user->gname = unknown_name;
  }
  return *user;
}

EntryHeader make_header_template(const HostIdentity &identity,
                                 EntryHeader::time_point now) {
  EntryHeader header;
  header.type = EntryType::Regular;
  header.mode = chunk_mode;
  header.uid = identity.uid;
  header.gid = identity.gid;
  header.uname = identity.uname;
  header.gname = identity.gname;
  header.mtime = now;
  header.atime = now;
  header.ctime = now;
  return header;
}

EntryHeader make_header_template() {
  return make_header_template(resolve_identity(IdentityLookup::system()),
                              std::chrono::system_clock::now());
}

} // namespace splittar

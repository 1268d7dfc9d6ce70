#include <splittar/error.hxx>

#include <string>

namespace splittar {

ShortWriteError::ShortWriteError(std::string entry_name,
                                 std::int64_t requested, std::int64_t written)
    : TargetWriteError(entry_name,
                       "bytes written to archive entry " + entry_name + " (" +
                           std::to_string(written) +
                           ") do not equal expected count (" +
                           std::to_string(requested) + ")"),
      requested_(requested), written_(written) {}

std::string describe(const std::exception &e) {
  std::string message = e.what();
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception &cause) {
    auto inner = describe(cause);
    // Wrapping errors usually repeat their cause already.
    if (message.find(inner) == std::string::npos)
      message += ": " + inner;
  }
  return message;
}

} // namespace splittar

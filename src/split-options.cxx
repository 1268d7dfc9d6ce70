#include <splittar/error.hxx>
#include <splittar/split-options.hxx>

#include <iomanip>
#include <sstream>

namespace splittar {

void validate(const SplitOptions &options) {
  if (options.chunk_size <= 0)
    throw ConfigError("chunk size cannot be <= 0: " +
                      std::to_string(options.chunk_size));
  if (options.suffix_width <= 0)
    throw ConfigError("suffix width cannot be <= 0: " +
                      std::to_string(options.suffix_width));
  if (options.naming == EntryNaming::BaseName && options.base_name.empty())
    throw ConfigError("basename naming requires a base name");
}

std::string entry_name(const SplitOptions &options, std::int64_t index) {
  std::ostringstream name;
  if (options.naming == EntryNaming::BaseName)
    name << options.base_name << '.';
  name << std::setw(options.suffix_width) << std::setfill('0') << index;
  return name.str();
}

EntryNaming parse_entry_naming(const std::string &text) {
  if (text == "index")
    return EntryNaming::Index;
  if (text == "basename")
    return EntryNaming::BaseName;
  throw ConfigError("unknown naming mode \"" + text +
                    "\", expected index or basename");
}

} // namespace splittar

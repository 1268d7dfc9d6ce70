#include <splittar/command-line.hxx>
#include <splittar/error.hxx>
#include <splittar/logging.hxx>
#include <splittar/run.hxx>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>

namespace {

constexpr int exit_usage = 2;

} // namespace

int main(int argc, char *argv[]) {
  auto const program = std::filesystem::path(argv[0]).filename().string();

  splittar::CommandLine command_line;
  try {
    command_line = splittar::parse_command_line(argc, argv);
  } catch (const splittar::ConfigError &e) {
    std::cerr << program << ": " << splittar::describe(e) << "\n\n"
              << "Run \"" << program << " -h\" for usage.\n";
    return exit_usage;
  }

  if (command_line.show_help) {
    std::cout << splittar::usage(program);
    return EXIT_SUCCESS;
  }

  splittar::init_logging(command_line.log_level);

  try {
    splittar::run(command_line.config);
  } catch (const splittar::ConfigError &e) {
    std::cerr << program << ": " << splittar::describe(e) << '\n';
    return exit_usage;
  } catch (const std::exception &e) {
    std::cerr << program << ": " << splittar::describe(e) << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

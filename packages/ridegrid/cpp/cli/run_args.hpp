#ifndef PACKAGES_RIDEGRID_CPP_CLI_RUN_ARGS_HPP_
#define PACKAGES_RIDEGRID_CPP_CLI_RUN_ARGS_HPP_

#include <optional>
#include <string>

#include "core/types.hpp"

namespace ridegrid::cli {

struct ParsedArgs {
  std::string config_path;
  TickCount ticks = 1000;
  std::optional<unsigned int> seed;
  bool csv = false;
  bool help = false;
};

// Flags take their value as `--flag VALUE` or `--flag=VALUE`. Throws std::runtime_error on bad input.
ParsedArgs ParseArgs(int argc, const char* const* argv);

std::string Usage(const std::string& program);

}  // namespace ridegrid::cli

#endif  // PACKAGES_RIDEGRID_CPP_CLI_RUN_ARGS_HPP_

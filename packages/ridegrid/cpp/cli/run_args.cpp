#include "cli/run_args.hpp"

#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace ridegrid::cli {

namespace {

// Matches `flag` exactly or `flag=value`; `inline_value` receives whatever follows the '='.
bool MatchFlag(std::string_view token, std::string_view flag, std::optional<std::string>& inline_value) {
  inline_value.reset();
  if (token == flag) {
    return true;
  }
  if (token.size() > flag.size() && token.substr(0, flag.size()) == flag && token[flag.size()] == '=') {
    inline_value = std::string(token.substr(flag.size() + 1));
    return true;
  }
  return false;
}

unsigned int ParseUnsigned(const std::string& value, const char* name) {
  size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(std::string(name) + " must be a non-negative 32-bit integer, got '" + value + "'");
  }
  if (consumed != value.size() || parsed < 0 || parsed > UINT32_MAX) {
    throw std::runtime_error(std::string(name) + " must be a non-negative 32-bit integer, got '" + value + "'");
  }
  return static_cast<unsigned int>(parsed);
}

}  // namespace

ParsedArgs ParseArgs(int argc, const char* const* argv) {
  ParsedArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string_view token(argv[i]);
    std::optional<std::string> inline_value;
    auto ExpectValue = [&](const char* flag) {
      if (inline_value.has_value()) {
        if (inline_value->empty()) {
          throw std::runtime_error(std::string("empty value for ") + flag);
        }
        return *inline_value;
      }
      if (i + 1 >= argc) {
        throw std::runtime_error(std::string("missing value for ") + flag);
      }
      return std::string(argv[++i]);
    };

    if (MatchFlag(token, "--config", inline_value)) {
      args.config_path = ExpectValue("--config");
    } else if (MatchFlag(token, "--ticks", inline_value)) {
      args.ticks = ParseUnsigned(ExpectValue("--ticks"), "ticks");
    } else if (MatchFlag(token, "--seed", inline_value)) {
      args.seed = ParseUnsigned(ExpectValue("--seed"), "seed");
    } else if (token == "--csv") {
      args.csv = true;
    } else if (token == "--help" || token == "-h") {
      args.help = true;
      return args;
    } else {
      throw std::runtime_error(std::string("unknown argument: ") + std::string(token));
    }
  }
  if (args.config_path.empty()) {
    throw std::runtime_error("--config is required");
  }
  return args;
}

std::string Usage(const std::string& program) {
  return "Usage: " + program + " --config FILE [--ticks N] [--seed S] [--csv]\n" +
         "Defaults: ticks=1000, seed from the config's deterministic_mode\n";
}

}  // namespace ridegrid::cli

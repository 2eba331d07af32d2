#pragma once

namespace feedctl::cli {

/// ANSI escape sequences used for diagnostics on stderr.
struct ColorCodes {
  const char* red;
  const char* yellow;
  const char* reset;
};

inline constexpr ColorCodes kColor{"\033[31m", "\033[33m", "\033[0m"};

}  // namespace feedctl::cli

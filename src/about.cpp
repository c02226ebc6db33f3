#include "bitmate/about.hpp"

#ifndef BITMATE_VERSION
#error "BITMATE_VERSION must be defined by the build"
#endif

namespace bitmate {

std::string engine_name() {
  return "bitmate";
}

// Set from the CMake project version.
std::string engine_version() {
  return BITMATE_VERSION;
}

std::string about_message() {
  return engine_name() + " " + engine_version() +
         " - bitboard move generation for FEN positions";
}

void print_about(std::ostream& os) {
  os << about_message() << '\n';
}

} // namespace bitmate

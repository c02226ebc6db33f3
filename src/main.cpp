#include <iostream>
#include <string>
#include <vector>

#include "bitmate/cli.hpp"

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  return bitmate::cli::run(args, std::cout, std::cerr);
}

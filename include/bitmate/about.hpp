#pragma once

#include <ostream>
#include <string>

namespace bitmate {

std::string engine_name();
std::string engine_version();

// "<name> <version> - <one line description>", printed by --version and at
// the top of --help.
std::string about_message();
void print_about(std::ostream& os);

} // namespace bitmate

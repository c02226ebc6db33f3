#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "bitmate/about.hpp"

TEST(About, MessageIncludesNameAndVersion) {
  const auto message = bitmate::about_message();
  EXPECT_EQ(message.rfind(bitmate::engine_name() + " " + bitmate::engine_version(), 0), 0U);
}

TEST(About, PrintWritesMessageWithNewline) {
  std::ostringstream buffer;
  bitmate::print_about(buffer);
  EXPECT_EQ(buffer.str(), bitmate::about_message() + '\n');
}

TEST(About, VersionIsDottedNumbers) {
  const auto version = bitmate::engine_version();
  ASSERT_FALSE(version.empty());
  EXPECT_EQ(version.find_first_not_of("0123456789."), std::string::npos);
}

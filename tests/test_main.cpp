#include "observability/logger.hpp"

#include <gtest/gtest.h>

#include <sstream>

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);

  // Keep pipeline logging out of the test output
  static std::ostringstream sink;
  sentinel::observability::Logger::getInstance().setOutputStream(sink);

  return RUN_ALL_TESTS();
}

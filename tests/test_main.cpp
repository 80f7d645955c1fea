#include "flowcore/util/log.hpp"

#include <csignal>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  // Global signal handling for tests
  std::signal(SIGPIPE, SIG_IGN);
  flowcore::log::set_output_stderr();
  flowcore::log::set_level(flowcore::log::Level::Warn);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

#include "banana/util/log.hpp"

#include <csignal>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  // Global signal handling for tests
  std::signal(SIGPIPE, SIG_IGN);
  banana::log::set_output_stderr();
  banana::log::set_level(banana::log::Level::Error);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

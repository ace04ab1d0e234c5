#include "gqlexec/util/log.hpp"

#include <csignal>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);
  gqlexec::log::set_output_stderr();
  gqlexec::log::set_level(gqlexec::log::Level::Error);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

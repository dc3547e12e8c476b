#include "support/Log.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace lfx;

TEST(Log, ParsesLevelNames) {
  log::Level lvl = log::Level::Error;
  EXPECT_TRUE(log::parseLevel("WARNING", lvl));
  EXPECT_EQ(lvl, log::Level::Warn);
  EXPECT_TRUE(log::parseLevel("debug", lvl));
  EXPECT_EQ(lvl, log::Level::Debug);
  EXPECT_FALSE(log::parseLevel("loud", lvl));
  EXPECT_EQ(lvl, log::Level::Debug);
}

TEST(Log, ConcurrentWritersKeepWholeLines) {
  log::Level saved = log::level();
  log::setLevel(log::Level::Debug);
  std::vector<std::thread> writers;
  for (int t = 0; t < 8; ++t)
    writers.emplace_back([t] {
      for (int i = 0; i < 50; ++i) {
        log::debug() << "writer " << t << " line " << i << "\n";
        log::info() << "writer " << t << " score " << 0.5 << "\n";
      }
    });
  for (auto& w : writers) w.join();
  log::setLevel(saved);
  EXPECT_EQ(log::level(), saved);
}

TEST(Log, DisabledLevelsAreDropped) {
  log::Level saved = log::level();
  log::setLevel(log::Level::Error);
  log::debug() << "never shown\n";
  log::warn() << "never shown\n";
  EXPECT_EQ(log::level(), log::Level::Error);
  log::setLevel(saved);
}

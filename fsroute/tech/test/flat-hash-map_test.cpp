#include "fsroute/flat-hash-map.hpp"

#include <gtest/gtest.h>

#include <string>

namespace fsroute {

TEST(FlatHashMap, AssignOverwrites) {
  flat_hash_map<int, std::string> map;
  map[3] = "blog";
  map[3] = "blog/2024";
  ASSERT_EQ(map.size(), 1U);
  EXPECT_EQ(map.find(3)->second, "blog/2024");
  EXPECT_EQ(map.find(4), map.end());
}

TEST(FlatHashMap, EraseByKeyKeepsOthersReachable) {
  flat_hash_map<int, std::string> map;
  for (int wd = 1; wd <= 100; ++wd) {
    map[wd] = "dir" + std::to_string(wd);
  }
  for (int wd = 2; wd <= 100; wd += 2) {
    EXPECT_EQ(map.erase(wd), 1U);
  }
  EXPECT_EQ(map.erase(2), 0U);
  EXPECT_EQ(map.size(), 50U);
  for (int wd = 1; wd <= 100; wd += 2) {
    const auto it = map.find(wd);
    ASSERT_NE(it, map.end());
    EXPECT_EQ(it->second, "dir" + std::to_string(wd));
  }
}

}  // namespace fsroute

#include <gtest/gtest.h>
#include "hw/hex_map.h"

using namespace hw;

TEST(HexMap, Bounds) {
    HexMap map(6, 4);
    EXPECT_TRUE(map.contains({0, 0}));
    EXPECT_TRUE(map.contains({5, 3}));
    EXPECT_FALSE(map.contains({6, 0}));
    EXPECT_FALSE(map.contains({0, 4}));
    EXPECT_FALSE(map.contains({-1, 2}));
    EXPECT_FALSE(map.contains({2, -1}));
}

TEST(HexMap, MissingHexReadsAsClear) {
    HexMap map(6, 4);
    EXPECT_EQ(map.find({2, 2}), nullptr);
    Hex h = map.at({2, 2});
    EXPECT_EQ(h.coord, (HexCoord{2, 2}));
    EXPECT_EQ(h.terrain, Terrain::CLEAR);
    EXPECT_EQ(h.rivers, 0);
    EXPECT_EQ(h.roads, 0);
}

TEST(HexMap, BuildFromHexList) {
    Hex forest;
    forest.coord = {1, 1};
    forest.terrain = Terrain::FOREST;
    forest.roads = sideBit(HexSide::BOTTOM);
    HexMap map({4, 4}, {forest});

    ASSERT_NE(map.find({1, 1}), nullptr);
    EXPECT_EQ(map.at({1, 1}).terrain, Terrain::FOREST);
    EXPECT_TRUE(map.at({1, 1}).hasRoad(HexSide::BOTTOM));
    EXPECT_FALSE(map.at({1, 1}).hasRoad(HexSide::TOP));
    EXPECT_EQ(map.storedCount(), 1);
}

TEST(HexMap, SetTerrain) {
    HexMap map(4, 4);
    map.setTerrain({3, 3}, Terrain::WATER);
    EXPECT_EQ(map.at({3, 3}).terrain, Terrain::WATER);
    map.setTerrain({3, 3}, Terrain::TOWN);
    EXPECT_EQ(map.at({3, 3}).terrain, Terrain::TOWN);
    EXPECT_EQ(map.storedCount(), 1);
}

TEST(HexMap, RiverWrittenOnBothSides) {
    HexMap map(8, 8);
    map.addRiver({4, 4}, HexSide::TOP_RIGHT);
    EXPECT_TRUE(map.at({4, 4}).hasRiver(HexSide::TOP_RIGHT));
    EXPECT_TRUE(map.at({5, 3}).hasRiver(HexSide::BOTTOM_LEFT));
    EXPECT_FALSE(map.at({5, 3}).hasRoad(HexSide::BOTTOM_LEFT));
}

TEST(HexMap, RoadWrittenOnBothSides) {
    HexMap map(8, 8);
    map.addRoad({5, 4}, HexSide::BOTTOM_RIGHT);
    EXPECT_TRUE(map.at({5, 4}).hasRoad(HexSide::BOTTOM_RIGHT));
    EXPECT_TRUE(map.at({6, 5}).hasRoad(HexSide::TOP_LEFT));
}

TEST(HexMap, EdgeOnMapBorderStaysOnOneHex) {
    HexMap map(4, 4);
    map.addRiver({0, 0}, HexSide::TOP);
    EXPECT_TRUE(map.at({0, 0}).hasRiver(HexSide::TOP));
    EXPECT_EQ(map.storedCount(), 1);
}

TEST(HexMap, EditingKeepsTerrain) {
    HexMap map(8, 8);
    map.setTerrain({2, 2}, Terrain::SWAMP);
    map.addRoad({2, 2}, HexSide::BOTTOM);
    EXPECT_EQ(map.at({2, 2}).terrain, Terrain::SWAMP);
    EXPECT_EQ(map.at({2, 3}).terrain, Terrain::CLEAR);
    EXPECT_TRUE(map.at({2, 3}).hasRoad(HexSide::TOP));
}

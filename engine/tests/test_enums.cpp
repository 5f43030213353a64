#include <gtest/gtest.h>
#include "hw/enums.h"

using namespace hw;

TEST(Enums, Opponent) {
    EXPECT_EQ(opponent(PlayerSide::PLAYER_ONE), PlayerSide::PLAYER_TWO);
    EXPECT_EQ(opponent(PlayerSide::PLAYER_TWO), PlayerSide::PLAYER_ONE);
}

TEST(Enums, PlayerNumbers) {
    EXPECT_EQ(playerNumber(PlayerSide::PLAYER_ONE), 1);
    EXPECT_EQ(playerNumber(PlayerSide::PLAYER_TWO), 2);
    EXPECT_EQ(playerSideFromNumber(1), PlayerSide::PLAYER_ONE);
    EXPECT_EQ(playerSideFromNumber(2), PlayerSide::PLAYER_TWO);
}

TEST(Enums, SideBits) {
    EXPECT_EQ(sideBit(HexSide::TOP), 1);
    EXPECT_EQ(sideBit(HexSide::BOTTOM), 8);
    EXPECT_EQ(sideBit(HexSide::TOP_LEFT), 32);
    EXPECT_EQ(sideFromIndex(0), HexSide::TOP);
    EXPECT_EQ(sideFromIndex(5), HexSide::TOP_LEFT);
    EXPECT_EQ(sideFromIndex(6), HexSide::TOP);
    EXPECT_EQ(sideFromIndex(-1), HexSide::TOP_LEFT);
}

TEST(Enums, TerrainNames) {
    EXPECT_EQ(terrainFromString("clear"), Terrain::CLEAR);
    EXPECT_EQ(terrainFromString("Mountain"), Terrain::MOUNTAIN);
    EXPECT_EQ(terrainFromString("FOREST"), Terrain::FOREST);
    EXPECT_EQ(terrainFromString("water"), Terrain::WATER);
    EXPECT_EQ(terrainFromString("desert"), Terrain::DESERT);
    EXPECT_EQ(terrainFromString("swamp"), Terrain::SWAMP);
    EXPECT_EQ(terrainFromString("town"), Terrain::TOWN);
    EXPECT_EQ(terrainFromString("lava"), Terrain::UNKNOWN);
    EXPECT_STREQ(terrainName(Terrain::SWAMP), "swamp");
}

TEST(Enums, BranchNames) {
    EXPECT_EQ(branchFromString("Infantry"), Branch::INFANTRY);
    EXPECT_EQ(branchFromString("cavalry"), Branch::CAVALRY);
    EXPECT_EQ(branchFromString("Artillery"), Branch::ARTILLERY);
    EXPECT_EQ(branchFromString(""), Branch::INFANTRY);
    EXPECT_STREQ(branchName(Branch::ARTILLERY), "Artillery");
}

TEST(Enums, UnitStatusNames) {
    EXPECT_EQ(unitStatusFromString("selected"), UnitStatus::SELECTED);
    EXPECT_EQ(unitStatusFromString("moved"), UnitStatus::MOVED);
    EXPECT_EQ(unitStatusFromString("whatever"), UnitStatus::AVAILABLE);
    EXPECT_STREQ(unitStatusName(UnitStatus::AVAILABLE), "available");
}

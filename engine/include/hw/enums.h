#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace hw {

// --- PlayerSide ---
enum class PlayerSide : uint8_t { PLAYER_ONE, PLAYER_TWO };

inline PlayerSide opponent(PlayerSide side) {
    return side == PlayerSide::PLAYER_ONE ? PlayerSide::PLAYER_TWO : PlayerSide::PLAYER_ONE;
}

// Documents number players 1 and 2
inline int playerNumber(PlayerSide side) {
    return side == PlayerSide::PLAYER_ONE ? 1 : 2;
}

inline PlayerSide playerSideFromNumber(int n) {
    return n == 2 ? PlayerSide::PLAYER_TWO : PlayerSide::PLAYER_ONE;
}

// --- Terrain ---
// UNKNOWN holds anything a document names that we don't recognise.
enum class Terrain : uint8_t {
    CLEAR, MOUNTAIN, FOREST, WATER, DESERT, SWAMP, TOWN, UNKNOWN
};

// --- Branch ---
enum class Branch : uint8_t { INFANTRY, CAVALRY, ARTILLERY };

// --- UnitStatus ---
// Owned by the turn logic; the movement engine never reads it.
enum class UnitStatus : uint8_t { AVAILABLE, SELECTED, MOVED };

// --- HexSide ---
// Clockwise from north on a flat-top hex. Values double as bit indices
// into the river/road masks.
enum class HexSide : uint8_t {
    TOP = 0,
    TOP_RIGHT,
    BOTTOM_RIGHT,
    BOTTOM,
    BOTTOM_LEFT,
    TOP_LEFT
};

constexpr int HEX_SIDE_COUNT = 6;

inline uint8_t sideBit(HexSide side) {
    return static_cast<uint8_t>(1u << static_cast<int>(side));
}

inline HexSide sideFromIndex(int i) {
    return static_cast<HexSide>(((i % HEX_SIDE_COUNT) + HEX_SIDE_COUNT) % HEX_SIDE_COUNT);
}

// --- String conversions (scenario documents) ---

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline Terrain terrainFromString(const std::string& name) {
    std::string n = toLower(name);
    if (n == "clear")    return Terrain::CLEAR;
    if (n == "mountain") return Terrain::MOUNTAIN;
    if (n == "forest")   return Terrain::FOREST;
    if (n == "water")    return Terrain::WATER;
    if (n == "desert")   return Terrain::DESERT;
    if (n == "swamp")    return Terrain::SWAMP;
    if (n == "town")     return Terrain::TOWN;
    return Terrain::UNKNOWN;
}

inline const char* terrainName(Terrain t) {
    switch (t) {
        case Terrain::CLEAR:    return "clear";
        case Terrain::MOUNTAIN: return "mountain";
        case Terrain::FOREST:   return "forest";
        case Terrain::WATER:    return "water";
        case Terrain::DESERT:   return "desert";
        case Terrain::SWAMP:    return "swamp";
        case Terrain::TOWN:     return "town";
        case Terrain::UNKNOWN:  return "unknown";
    }
    return "unknown";
}

inline Branch branchFromString(const std::string& name) {
    std::string n = toLower(name);
    if (n == "cavalry")   return Branch::CAVALRY;
    if (n == "artillery") return Branch::ARTILLERY;
    return Branch::INFANTRY;
}

inline const char* branchName(Branch b) {
    switch (b) {
        case Branch::INFANTRY:  return "Infantry";
        case Branch::CAVALRY:   return "Cavalry";
        case Branch::ARTILLERY: return "Artillery";
    }
    return "Infantry";
}

inline UnitStatus unitStatusFromString(const std::string& name) {
    std::string n = toLower(name);
    if (n == "selected") return UnitStatus::SELECTED;
    if (n == "moved")    return UnitStatus::MOVED;
    return UnitStatus::AVAILABLE;
}

inline const char* unitStatusName(UnitStatus s) {
    switch (s) {
        case UnitStatus::AVAILABLE: return "available";
        case UnitStatus::SELECTED:  return "selected";
        case UnitStatus::MOVED:     return "moved";
    }
    return "available";
}

} // namespace hw

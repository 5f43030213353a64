#include "hw/hex_coord.h"
#include <algorithm>
#include <cstdlib>

namespace hw {

HexCoord HexCoord::neighbor(HexSide side) const {
    bool even = isEvenColumn();
    switch (side) {
        case HexSide::TOP:
            return {column, row - 1};
        case HexSide::TOP_RIGHT:
            return even ? HexCoord{column + 1, row - 1} : HexCoord{column + 1, row};
        case HexSide::BOTTOM_RIGHT:
            return even ? HexCoord{column + 1, row} : HexCoord{column + 1, row + 1};
        case HexSide::BOTTOM:
            return {column, row + 1};
        case HexSide::BOTTOM_LEFT:
            return even ? HexCoord{column - 1, row} : HexCoord{column - 1, row + 1};
        case HexSide::TOP_LEFT:
            return even ? HexCoord{column - 1, row - 1} : HexCoord{column - 1, row};
    }
    return *this;
}

std::array<HexCoord, 6> HexCoord::getAdjacent() const {
    return {{
        neighbor(HexSide::TOP),
        neighbor(HexSide::TOP_RIGHT),
        neighbor(HexSide::BOTTOM_RIGHT),
        neighbor(HexSide::BOTTOM),
        neighbor(HexSide::BOTTOM_LEFT),
        neighbor(HexSide::TOP_LEFT),
    }};
}

bool HexCoord::sideFacing(HexCoord other, HexSide& outSide) const {
    for (int i = 0; i < HEX_SIDE_COUNT; ++i) {
        HexSide side = sideFromIndex(i);
        if (neighbor(side) == other) {
            outSide = side;
            return true;
        }
    }
    return false;
}

namespace {

// Cube coordinates (x, z); y = -x - z
struct Cube {
    int x;
    int z;
};

Cube toCube(HexCoord c) {
    // Odd columns are shifted down by half a hex
    int shift = (c.column - (c.column & 1)) / 2;
    return {c.column, c.row - shift};
}

} // anonymous namespace

int HexCoord::distanceTo(HexCoord other) const {
    Cube a = toCube(*this);
    Cube b = toCube(other);
    int dx = a.x - b.x;
    int dz = a.z - b.z;
    int dy = -dx - dz;
    return std::max({std::abs(dx), std::abs(dy), std::abs(dz)});
}

std::string HexCoord::key() const {
    return std::to_string(column) + "," + std::to_string(row);
}

} // namespace hw

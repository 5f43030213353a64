#pragma once

#include "hw/enums.h"
#include <array>
#include <string>

namespace hw {

// The side of the neighbouring hex that shares an edge with `side`.
// Holds for both column parities.
inline HexSide opposite(HexSide side) {
    return static_cast<HexSide>((static_cast<int>(side) + 3) % HEX_SIDE_COUNT);
}

// Offset coordinate on a flat-top grid. Odd columns sit half a hex lower
// than even ones, so diagonal neighbours depend on column parity.
struct HexCoord {
    int column = 0;
    int row = 0;

    bool isEvenColumn() const { return column % 2 == 0; }

    HexCoord neighbor(HexSide side) const;

    // All 6 neighbours in side order TOP..TOP_LEFT (some may be off-map)
    std::array<HexCoord, 6> getAdjacent() const;

    // Side of this hex that faces `other`. Returns false if not adjacent.
    bool sideFacing(HexCoord other, HexSide& outSide) const;

    // Number of hex steps between the two hexes
    int distanceTo(HexCoord other) const;

    // "column,row"
    std::string key() const;

    bool operator==(HexCoord o) const { return column == o.column && row == o.row; }
    bool operator!=(HexCoord o) const { return !(*this == o); }
    bool operator<(HexCoord o) const {
        return column != o.column ? column < o.column : row < o.row;
    }
};

} // namespace hw

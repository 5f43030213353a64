#pragma once

#include "hw/enums.h"
#include "hw/hex_map.h"
#include <optional>

namespace hw {

// Terrain cost before any edge features: Clear/Town 1, Mountain/Forest 2,
// Swamp/Desert 3, anything unrecognised 1. Water has no cost (impassable).
int baseTerrainCost(Terrain terrain);

inline bool isImpassable(Terrain terrain) {
    return terrain == Terrain::WATER;
}

// Extra points to cross a river: Artillery 2, everyone else 1
int riverSurcharge(Branch branch);

// Cost to enter `dest` through its `entrySide`. `source` (may be null) is the
// hex being left through `exitSide`; a road or river on either copy of the
// edge counts. Road entry always costs exactly 1 and ignores rivers.
// Returns std::nullopt when the hex cannot be entered at all.
std::optional<int> entryCost(const Hex& dest, HexSide entrySide,
                             const Hex* source, HexSide exitSide,
                             Branch branch);

// Same, without a source hex (only the destination's masks are consulted)
std::optional<int> entryCost(const Hex& dest, HexSide entrySide, Branch branch);

} // namespace hw

#pragma once

#include "hw/enums.h"
#include "hw/hex_coord.h"
#include "hw/hex_map.h"
#include "hw/unit.h"
#include <map>
#include <string>
#include <vector>

namespace hw {

// Reachable hex -> minimum movement points to enter it. The start hex is
// always present with cost 0.
using MovementRange = std::map<HexCoord, int>;

// All hexes a unit at `start` can move to this turn.
//
// Dijkstra over the hex grid using entryCost() for every edge. Hexes held by
// the enemy and impassable hexes are never entered. A hex next to an enemy
// that is not cut off by a river on the shared edge is recorded but movement
// stops there. If nothing but the start is reachable and the allowance is at
// least 1, the first enterable neighbour (side order TOP..TOP_LEFT) is added
// at its real cost, even if that exceeds the allowance.
//
// Throws std::invalid_argument for a negative allowance and
// std::out_of_range if `start` lies outside the map.
MovementRange calculateMovementRange(HexCoord start, int movementAllowance,
                                     Branch branch, PlayerSide side,
                                     const HexMap& map,
                                     const std::vector<Unit>& units);

// Range for `unit` from its current position, using its own allowance
MovementRange calculateMovementRange(const Unit& unit, const HexMap& map,
                                     const std::vector<Unit>& units);

// Range keys other than `start`, in coordinate order
std::vector<HexCoord> reachableDestinations(const MovementRange& range, HexCoord start);

struct MoveCheck {
    bool legal = false;
    int cost = 0;
    std::string reason;
};

// Can `unit` end its move on `dest` this turn?
MoveCheck checkMove(const Unit& unit, HexCoord dest, const HexMap& map,
                    const std::vector<Unit>& units);

} // namespace hw

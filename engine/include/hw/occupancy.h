#pragma once

#include "hw/enums.h"
#include "hw/hex_coord.h"
#include "hw/hex_map.h"
#include "hw/unit.h"
#include <map>
#include <vector>

namespace hw {

// Per-call lookup from hex to the units standing on it, seen from the
// moving side. Holds pointers into the caller's unit vector.
class OccupancyIndex {
    std::map<HexCoord, std::vector<const Unit*>> byHex_;
    PlayerSide mover_;

public:
    OccupancyIndex(const std::vector<Unit>& units, PlayerSide mover);

    PlayerSide mover() const { return mover_; }

    // Empty if nobody stands there
    const std::vector<const Unit*>& unitsAt(HexCoord c) const;

    bool isEnemyOccupied(HexCoord c) const;
    bool isFriendlyOccupied(HexCoord c) const;

    int countAdjacentEnemies(HexCoord c) const;

    // True if some neighbour holds an enemy and this hex has no river on
    // the side facing it. Entering such a hex ends the move.
    bool hasUnseparatedEnemyAdjacent(const HexMap& map, HexCoord c) const;
};

} // namespace hw

#include "hw/occupancy.h"

namespace hw {

OccupancyIndex::OccupancyIndex(const std::vector<Unit>& units, PlayerSide mover)
    : mover_(mover) {
    for (const auto& u : units) {
        byHex_[u.position].push_back(&u);
    }
}

const std::vector<const Unit*>& OccupancyIndex::unitsAt(HexCoord c) const {
    static const std::vector<const Unit*> empty;
    auto it = byHex_.find(c);
    return it == byHex_.end() ? empty : it->second;
}

bool OccupancyIndex::isEnemyOccupied(HexCoord c) const {
    for (const Unit* u : unitsAt(c)) {
        if (u->side != mover_) return true;
    }
    return false;
}

bool OccupancyIndex::isFriendlyOccupied(HexCoord c) const {
    for (const Unit* u : unitsAt(c)) {
        if (u->side == mover_) return true;
    }
    return false;
}

int OccupancyIndex::countAdjacentEnemies(HexCoord c) const {
    int count = 0;
    for (auto adj : c.getAdjacent()) {
        if (isEnemyOccupied(adj)) count++;
    }
    return count;
}

bool OccupancyIndex::hasUnseparatedEnemyAdjacent(const HexMap& map, HexCoord c) const {
    // Only this hex's river mask is consulted here
    const Hex* here = map.find(c);
    uint8_t rivers = here ? here->rivers : 0;

    for (int i = 0; i < HEX_SIDE_COUNT; ++i) {
        HexSide side = sideFromIndex(i);
        if (!isEnemyOccupied(c.neighbor(side))) continue;
        if ((rivers & sideBit(side)) == 0) return true;
    }
    return false;
}

} // namespace hw

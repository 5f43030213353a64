#include "hw/movement_cost.h"

namespace hw {

int baseTerrainCost(Terrain terrain) {
    switch (terrain) {
        case Terrain::CLEAR:
        case Terrain::TOWN:
            return 1;
        case Terrain::MOUNTAIN:
        case Terrain::FOREST:
            return 2;
        case Terrain::SWAMP:
        case Terrain::DESERT:
            return 3;
        default:
            return 1;
    }
}

int riverSurcharge(Branch branch) {
    return branch == Branch::ARTILLERY ? 2 : 1;
}

std::optional<int> entryCost(const Hex& dest, HexSide entrySide,
                             const Hex* source, HexSide exitSide,
                             Branch branch) {
    if (isImpassable(dest.terrain)) return std::nullopt;

    // Road on either copy of the edge: flat 1, rivers don't matter
    bool road = dest.hasRoad(entrySide) || (source && source->hasRoad(exitSide));
    if (road) return 1;

    int cost = baseTerrainCost(dest.terrain);

    bool river = dest.hasRiver(entrySide) || (source && source->hasRiver(exitSide));
    if (river) cost += riverSurcharge(branch);

    return cost;
}

std::optional<int> entryCost(const Hex& dest, HexSide entrySide, Branch branch) {
    return entryCost(dest, entrySide, nullptr, HexSide::TOP, branch);
}

} // namespace hw

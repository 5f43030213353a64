#pragma once

#include "hw/enums.h"
#include "hw/hex_coord.h"
#include <cstdint>
#include <map>
#include <vector>

namespace hw {

// One map hex. Rivers and roads run along edges, so each edge bit is
// normally stored on both hexes that share it.
struct Hex {
    HexCoord coord{};
    Terrain terrain = Terrain::CLEAR;
    uint8_t rivers = 0;  // bit i = river on side i
    uint8_t roads = 0;   // bit i = road on side i

    bool hasRiver(HexSide side) const { return (rivers & sideBit(side)) != 0; }
    bool hasRoad(HexSide side) const { return (roads & sideBit(side)) != 0; }
};

struct MapBounds {
    int columns = 0;
    int rows = 0;

    bool contains(HexCoord c) const {
        return c.column >= 0 && c.column < columns && c.row >= 0 && c.row < rows;
    }
};

class HexMap {
    MapBounds bounds_;
    std::map<HexCoord, Hex> hexes_;

public:
    HexMap() = default;
    HexMap(int columns, int rows);
    HexMap(MapBounds bounds, const std::vector<Hex>& hexes);

    const MapBounds& bounds() const { return bounds_; }
    bool contains(HexCoord c) const { return bounds_.contains(c); }

    // Stored record, or nullptr if the document never described this hex
    const Hex* find(HexCoord c) const;

    // Stored record, or a bare Clear hex with no edges
    Hex at(HexCoord c) const;

    void setHex(const Hex& hex);
    void setTerrain(HexCoord c, Terrain terrain);

    // Mark an edge on both hexes that share it
    void addRiver(HexCoord c, HexSide side);
    void addRoad(HexCoord c, HexSide side);

    int storedCount() const { return static_cast<int>(hexes_.size()); }
    std::vector<Hex> hexes() const;

private:
    Hex& recordAt(HexCoord c);
};

} // namespace hw

#include "hw/hex_map.h"

namespace hw {

HexMap::HexMap(int columns, int rows) : bounds_{columns, rows} {}

HexMap::HexMap(MapBounds bounds, const std::vector<Hex>& hexes) : bounds_(bounds) {
    for (const auto& h : hexes) {
        hexes_[h.coord] = h;
    }
}

const Hex* HexMap::find(HexCoord c) const {
    auto it = hexes_.find(c);
    return it == hexes_.end() ? nullptr : &it->second;
}

Hex HexMap::at(HexCoord c) const {
    const Hex* h = find(c);
    if (h) return *h;
    Hex bare;
    bare.coord = c;
    return bare;
}

Hex& HexMap::recordAt(HexCoord c) {
    auto it = hexes_.find(c);
    if (it == hexes_.end()) {
        Hex bare;
        bare.coord = c;
        it = hexes_.emplace(c, bare).first;
    }
    return it->second;
}

void HexMap::setHex(const Hex& hex) {
    hexes_[hex.coord] = hex;
}

void HexMap::setTerrain(HexCoord c, Terrain terrain) {
    recordAt(c).terrain = terrain;
}

void HexMap::addRiver(HexCoord c, HexSide side) {
    recordAt(c).rivers |= sideBit(side);
    HexCoord other = c.neighbor(side);
    if (contains(other)) {
        recordAt(other).rivers |= sideBit(opposite(side));
    }
}

void HexMap::addRoad(HexCoord c, HexSide side) {
    recordAt(c).roads |= sideBit(side);
    HexCoord other = c.neighbor(side);
    if (contains(other)) {
        recordAt(other).roads |= sideBit(opposite(side));
    }
}

std::vector<Hex> HexMap::hexes() const {
    std::vector<Hex> out;
    out.reserve(hexes_.size());
    for (const auto& kv : hexes_) {
        out.push_back(kv.second);
    }
    return out;
}

} // namespace hw

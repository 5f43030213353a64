#include "hw/movement_range.h"
#include "hw/movement_cost.h"
#include "hw/occupancy.h"
#include <functional>
#include <queue>
#include <set>
#include <stdexcept>

namespace hw {

namespace {

struct QueueEntry {
    int cost;
    HexCoord coord;

    bool operator>(const QueueEntry& o) const {
        if (cost != o.cost) return cost > o.cost;
        return o.coord < coord;
    }
};

using MinQueue = std::priority_queue<QueueEntry, std::vector<QueueEntry>,
                                     std::greater<QueueEntry>>;

// First enterable neighbour of start in side order, at its real edge cost
void addFallbackHex(MovementRange& range, HexCoord start, Branch branch,
                    const HexMap& map, const OccupancyIndex& occupancy) {
    Hex startHex = map.at(start);
    for (int i = 0; i < HEX_SIDE_COUNT; ++i) {
        HexSide side = sideFromIndex(i);
        HexCoord next = start.neighbor(side);
        if (!map.contains(next)) continue;
        if (occupancy.isEnemyOccupied(next)) continue;

        auto step = entryCost(map.at(next), opposite(side), &startHex, side, branch);
        if (!step) continue;

        range[next] = *step;
        return;
    }
}

} // anonymous namespace

MovementRange calculateMovementRange(HexCoord start, int movementAllowance,
                                     Branch branch, PlayerSide side,
                                     const HexMap& map,
                                     const std::vector<Unit>& units) {
    if (movementAllowance < 0) {
        throw std::invalid_argument("Movement allowance must be non-negative");
    }
    if (!map.contains(start)) {
        throw std::out_of_range("Start hex " + start.key() + " is outside the map");
    }

    OccupancyIndex occupancy(units, side);
    MovementRange range;

    std::map<HexCoord, int> best;
    std::set<HexCoord> finalized;
    MinQueue queue;

    best[start] = 0;
    queue.push({0, start});

    while (!queue.empty()) {
        QueueEntry cur = queue.top();
        queue.pop();

        if (finalized.count(cur.coord)) continue;
        if (cur.cost > best[cur.coord]) continue;  // stale entry
        finalized.insert(cur.coord);

        if (cur.cost <= movementAllowance) {
            range[cur.coord] = cur.cost;
        }

        // Next to an enemy with no river in between: the move ends here
        if (occupancy.hasUnseparatedEnemyAdjacent(map, cur.coord)) continue;

        Hex here = map.at(cur.coord);
        for (int i = 0; i < HEX_SIDE_COUNT; ++i) {
            HexSide exitSide = sideFromIndex(i);
            HexCoord next = cur.coord.neighbor(exitSide);
            if (!map.contains(next)) continue;
            if (finalized.count(next)) continue;
            if (occupancy.isEnemyOccupied(next)) continue;

            auto step = entryCost(map.at(next), opposite(exitSide), &here, exitSide, branch);
            if (!step) continue;

            // Costs only grow along a path, so nothing past the allowance
            // can lead back inside it
            int candidate = cur.cost + *step;
            if (candidate > movementAllowance) continue;

            auto it = best.find(next);
            if (it == best.end() || candidate < it->second) {
                best[next] = candidate;
                queue.push({candidate, next});
            }
        }
    }

    if (movementAllowance >= 1 && reachableDestinations(range, start).empty()) {
        addFallbackHex(range, start, branch, map, occupancy);
    }

    return range;
}

MovementRange calculateMovementRange(const Unit& unit, const HexMap& map,
                                     const std::vector<Unit>& units) {
    return calculateMovementRange(unit.position, unit.movementAllowance, unit.branch,
                                  unit.side, map, units);
}

std::vector<HexCoord> reachableDestinations(const MovementRange& range, HexCoord start) {
    std::vector<HexCoord> out;
    for (const auto& kv : range) {
        if (kv.first != start) out.push_back(kv.first);
    }
    return out;
}

MoveCheck checkMove(const Unit& unit, HexCoord dest, const HexMap& map,
                    const std::vector<Unit>& units) {
    MoveCheck result;

    if (!map.contains(dest)) {
        result.reason = "Destination hex (" + std::to_string(dest.column) + ", " +
                        std::to_string(dest.row) + ") is outside the map";
        return result;
    }
    if (dest == unit.position) {
        result.reason = "Unit is already on the destination hex";
        return result;
    }

    OccupancyIndex occupancy(units, unit.side);
    if (occupancy.isEnemyOccupied(dest)) {
        result.reason = "Cannot move to a hex occupied by an enemy unit";
        return result;
    }

    MovementRange range = calculateMovementRange(unit, map, units);
    auto it = range.find(dest);
    if (it == range.end()) {
        result.reason = "Destination hex (" + std::to_string(dest.column) + ", " +
                        std::to_string(dest.row) + ") is not within movement range. " +
                        "Movement allowance: " + std::to_string(unit.movementAllowance);
        return result;
    }

    result.legal = true;
    result.cost = it->second;
    return result;
}

} // namespace hw

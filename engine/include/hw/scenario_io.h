#pragma once

#include "hw/hex_map.h"
#include "hw/movement_range.h"
#include "hw/unit.h"
#include <string>
#include <vector>

namespace hw {

struct Scenario {
    std::string scenarioId;
    std::string title;
    std::string description;
    int turns = 1;
    HexMap map;
    std::vector<Unit> units;
};

// Parse a scenario document:
// {"columns", "rows", "hexes": [{"column","row","terrain","rivers","roads"}],
//  "units": [{"id","player","column","row","movementAllowance","arm",...}]}
// Malformed JSON or wrong field types throw nlohmann::json exceptions.
Scenario loadScenario(const std::string& jsonStr);

// Throws std::runtime_error if the file can't be opened
Scenario loadScenarioFromFile(const std::string& path);

std::string scenarioToJson(const Scenario& scenario);

// {"column,row": cost, ...}
std::string movementRangeToJson(const MovementRange& range);

// Copy of the scenario's units with the record sharing `unit.id` replaced
// by `unit`. Unknown ids leave the list unchanged.
std::vector<Unit> unitsWith(const Scenario& scenario, const Unit& unit);

const Unit* findUnit(const Scenario& scenario, const std::string& id);

} // namespace hw

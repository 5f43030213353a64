#include "hw/scenario_io.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace hw {

namespace {

Hex parseHex(const nlohmann::json& j) {
    Hex h;
    h.coord = {j.at("column").get<int>(), j.at("row").get<int>()};
    h.terrain = terrainFromString(j.value("terrain", std::string("clear")));
    h.rivers = static_cast<uint8_t>(j.value("rivers", 0) & 0x3F);
    h.roads = static_cast<uint8_t>(j.value("roads", 0) & 0x3F);
    return h;
}

Unit parseUnit(const nlohmann::json& j) {
    Unit u;
    u.id = j.value("id", std::string());
    u.side = playerSideFromNumber(j.value("player", 1));
    u.position = {j.at("column").get<int>(), j.at("row").get<int>()};
    u.movementAllowance = j.value("movementAllowance", 0);
    u.branch = branchFromString(j.value("arm", std::string("Infantry")));
    u.status = unitStatusFromString(j.value("status", std::string("available")));
    u.combatStrength = j.value("combatStrength", 0);
    return u;
}

} // anonymous namespace

Scenario loadScenario(const std::string& jsonStr) {
    auto j = nlohmann::json::parse(jsonStr);

    Scenario s;
    s.scenarioId = j.value("scenarioId", std::string());
    s.title = j.value("title", std::string());
    s.description = j.value("description", std::string());
    s.turns = j.value("turns", 1);

    MapBounds bounds{j.at("columns").get<int>(), j.at("rows").get<int>()};
    std::vector<Hex> hexes;
    if (j.contains("hexes")) {
        for (auto& h : j["hexes"]) {
            hexes.push_back(parseHex(h));
        }
    }
    s.map = HexMap(bounds, hexes);

    if (j.contains("units")) {
        for (auto& u : j["units"]) {
            s.units.push_back(parseUnit(u));
        }
    }
    return s;
}

Scenario loadScenarioFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open scenario file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return loadScenario(content);
}

std::string scenarioToJson(const Scenario& scenario) {
    nlohmann::json j;
    j["scenarioId"] = scenario.scenarioId;
    j["title"] = scenario.title;
    j["description"] = scenario.description;
    j["columns"] = scenario.map.bounds().columns;
    j["rows"] = scenario.map.bounds().rows;
    j["turns"] = scenario.turns;

    j["hexes"] = nlohmann::json::array();
    for (const auto& h : scenario.map.hexes()) {
        j["hexes"].push_back({
            {"column", h.coord.column},
            {"row", h.coord.row},
            {"terrain", terrainName(h.terrain)},
            {"rivers", h.rivers},
            {"roads", h.roads},
        });
    }

    j["units"] = nlohmann::json::array();
    for (const auto& u : scenario.units) {
        j["units"].push_back({
            {"id", u.id},
            {"player", playerNumber(u.side)},
            {"column", u.position.column},
            {"row", u.position.row},
            {"movementAllowance", u.movementAllowance},
            {"arm", branchName(u.branch)},
            {"status", unitStatusName(u.status)},
            {"combatStrength", u.combatStrength},
        });
    }
    return j.dump();
}

std::string movementRangeToJson(const MovementRange& range) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& kv : range) {
        j[kv.first.key()] = kv.second;
    }
    return j.dump();
}

std::vector<Unit> unitsWith(const Scenario& scenario, const Unit& unit) {
    std::vector<Unit> out = scenario.units;
    for (auto& u : out) {
        if (u.id == unit.id) u = unit;
    }
    return out;
}

const Unit* findUnit(const Scenario& scenario, const std::string& id) {
    for (const auto& u : scenario.units) {
        if (u.id == id) return &u;
    }
    return nullptr;
}

} // namespace hw

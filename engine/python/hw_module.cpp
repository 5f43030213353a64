#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "hw/enums.h"
#include "hw/hex_coord.h"
#include "hw/hex_map.h"
#include "hw/unit.h"
#include "hw/movement_cost.h"
#include "hw/movement_range.h"
#include "hw/scenario_io.h"

namespace py = pybind11;

namespace {

// Python sees the range as {(column, row): cost}
py::dict rangeToDict(const hw::MovementRange& range) {
    py::dict d;
    for (const auto& kv : range) {
        d[py::make_tuple(kv.first.column, kv.first.row)] = kv.second;
    }
    return d;
}

} // anonymous namespace

PYBIND11_MODULE(hw_engine, m) {
    m.doc() = "Hex wargame movement engine - Python bindings";

    // --- Enums ---
    py::enum_<hw::PlayerSide>(m, "PlayerSide")
        .value("PLAYER_ONE", hw::PlayerSide::PLAYER_ONE)
        .value("PLAYER_TWO", hw::PlayerSide::PLAYER_TWO);

    py::enum_<hw::Terrain>(m, "Terrain")
        .value("CLEAR", hw::Terrain::CLEAR)
        .value("MOUNTAIN", hw::Terrain::MOUNTAIN)
        .value("FOREST", hw::Terrain::FOREST)
        .value("WATER", hw::Terrain::WATER)
        .value("DESERT", hw::Terrain::DESERT)
        .value("SWAMP", hw::Terrain::SWAMP)
        .value("TOWN", hw::Terrain::TOWN)
        .value("UNKNOWN", hw::Terrain::UNKNOWN);

    py::enum_<hw::Branch>(m, "Branch")
        .value("INFANTRY", hw::Branch::INFANTRY)
        .value("CAVALRY", hw::Branch::CAVALRY)
        .value("ARTILLERY", hw::Branch::ARTILLERY);

    py::enum_<hw::UnitStatus>(m, "UnitStatus")
        .value("AVAILABLE", hw::UnitStatus::AVAILABLE)
        .value("SELECTED", hw::UnitStatus::SELECTED)
        .value("MOVED", hw::UnitStatus::MOVED);

    py::enum_<hw::HexSide>(m, "HexSide")
        .value("TOP", hw::HexSide::TOP)
        .value("TOP_RIGHT", hw::HexSide::TOP_RIGHT)
        .value("BOTTOM_RIGHT", hw::HexSide::BOTTOM_RIGHT)
        .value("BOTTOM", hw::HexSide::BOTTOM)
        .value("BOTTOM_LEFT", hw::HexSide::BOTTOM_LEFT)
        .value("TOP_LEFT", hw::HexSide::TOP_LEFT);

    m.def("opposite", &hw::opposite);

    // --- HexCoord ---
    py::class_<hw::HexCoord>(m, "HexCoord")
        .def(py::init<>())
        .def(py::init([](int column, int row) { return hw::HexCoord{column, row}; }))
        .def_readwrite("column", &hw::HexCoord::column)
        .def_readwrite("row", &hw::HexCoord::row)
        .def("neighbor", &hw::HexCoord::neighbor)
        .def("get_adjacent", &hw::HexCoord::getAdjacent)
        .def("distance_to", &hw::HexCoord::distanceTo)
        .def("key", &hw::HexCoord::key)
        .def("__repr__", [](const hw::HexCoord& c) {
            return "HexCoord(" + std::to_string(c.column) + ", " + std::to_string(c.row) + ")";
        })
        .def("__eq__", [](const hw::HexCoord& a, const hw::HexCoord& b) {
            return a == b;
        });

    // --- Hex ---
    py::class_<hw::Hex>(m, "Hex")
        .def(py::init<>())
        .def_readwrite("coord", &hw::Hex::coord)
        .def_readwrite("terrain", &hw::Hex::terrain)
        .def_readwrite("rivers", &hw::Hex::rivers)
        .def_readwrite("roads", &hw::Hex::roads)
        .def("has_river", &hw::Hex::hasRiver)
        .def("has_road", &hw::Hex::hasRoad);

    // --- HexMap ---
    py::class_<hw::HexMap>(m, "HexMap")
        .def(py::init<int, int>())
        .def("contains", &hw::HexMap::contains)
        .def("at", &hw::HexMap::at)
        .def("set_hex", &hw::HexMap::setHex)
        .def("set_terrain", &hw::HexMap::setTerrain)
        .def("add_river", &hw::HexMap::addRiver)
        .def("add_road", &hw::HexMap::addRoad)
        .def("hexes", &hw::HexMap::hexes)
        .def_property_readonly("columns", [](const hw::HexMap& map) { return map.bounds().columns; })
        .def_property_readonly("rows", [](const hw::HexMap& map) { return map.bounds().rows; });

    // --- Unit ---
    py::class_<hw::Unit>(m, "Unit")
        .def(py::init<>())
        .def_readwrite("id", &hw::Unit::id)
        .def_readwrite("side", &hw::Unit::side)
        .def_readwrite("position", &hw::Unit::position)
        .def_readwrite("movement_allowance", &hw::Unit::movementAllowance)
        .def_readwrite("branch", &hw::Unit::branch)
        .def_readwrite("status", &hw::Unit::status)
        .def_readwrite("combat_strength", &hw::Unit::combatStrength);

    // --- MoveCheck ---
    py::class_<hw::MoveCheck>(m, "MoveCheck")
        .def_readonly("legal", &hw::MoveCheck::legal)
        .def_readonly("cost", &hw::MoveCheck::cost)
        .def_readonly("reason", &hw::MoveCheck::reason);

    // --- Scenario ---
    py::class_<hw::Scenario>(m, "Scenario")
        .def_readwrite("scenario_id", &hw::Scenario::scenarioId)
        .def_readwrite("title", &hw::Scenario::title)
        .def_readwrite("description", &hw::Scenario::description)
        .def_readwrite("turns", &hw::Scenario::turns)
        .def_readwrite("map", &hw::Scenario::map)
        .def_readwrite("units", &hw::Scenario::units)
        .def("to_json", &hw::scenarioToJson);

    // --- Functions ---
    m.def("entry_cost",
          [](const hw::Hex& dest, hw::HexSide entrySide, const hw::Hex* source,
             hw::HexSide exitSide, hw::Branch branch) {
              return hw::entryCost(dest, entrySide, source, exitSide, branch);
          },
          py::arg("dest"), py::arg("entry_side"), py::arg("source") = nullptr,
          py::arg("exit_side") = hw::HexSide::TOP, py::arg("branch") = hw::Branch::INFANTRY,
          "Cost to enter dest through entry_side, or None if impassable");

    m.def("calculate_movement_range",
          [](hw::HexCoord start, int allowance, hw::Branch branch, hw::PlayerSide side,
             const hw::HexMap& map, const std::vector<hw::Unit>& units) {
              return rangeToDict(hw::calculateMovementRange(start, allowance, branch,
                                                            side, map, units));
          },
          py::arg("start"), py::arg("allowance"), py::arg("branch"), py::arg("side"),
          py::arg("map"), py::arg("units"));

    m.def("unit_movement_range",
          [](const hw::Unit& unit, const hw::HexMap& map, const std::vector<hw::Unit>& units) {
              return rangeToDict(hw::calculateMovementRange(unit, map, units));
          },
          py::arg("unit"), py::arg("map"), py::arg("units"));

    m.def("check_move", &hw::checkMove,
          py::arg("unit"), py::arg("dest"), py::arg("map"), py::arg("units"));

    m.def("load_scenario", &hw::loadScenario, py::arg("json_str"));
    m.def("load_scenario_from_file", &hw::loadScenarioFromFile, py::arg("path"));
}

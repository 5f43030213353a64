#include "hw/movement_range.h"
#include "hw/scenario_io.h"
#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

using namespace hw;

namespace {

struct Options {
    std::string scenarioPath;
    std::string unitId;
    int column = -1;
    int row = -1;
    int allowance = -1;
    std::string branch;
    int side = 0;
    std::string format = "json";
    bool verbose = false;
};

void printUsage() {
    std::cout << "Usage: hw_range_cli --scenario=PATH [options]\n"
              << "\nOptions:\n"
              << "  --scenario=PATH   Scenario JSON document (required)\n"
              << "  --unit=ID         Unit to move; supplies position, allowance, arm, side\n"
              << "  --column=N        Start column (overrides the unit's)\n"
              << "  --row=N           Start row (overrides the unit's)\n"
              << "  --allowance=N     Movement allowance (overrides the unit's)\n"
              << "  --branch=B        Infantry, Cavalry or Artillery (overrides the unit's)\n"
              << "  --side=1|2        Moving player (overrides the unit's)\n"
              << "  --format=F        json or grid (default: json)\n"
              << "  --verbose         Print solver inputs to stderr\n"
              << "  --help            Show this help\n";
}

Options parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--scenario=") == 0) opts.scenarioPath = arg.substr(11);
        else if (arg.find("--unit=") == 0) opts.unitId = arg.substr(7);
        else if (arg.find("--column=") == 0) opts.column = std::stoi(arg.substr(9));
        else if (arg.find("--row=") == 0) opts.row = std::stoi(arg.substr(6));
        else if (arg.find("--allowance=") == 0) opts.allowance = std::stoi(arg.substr(12));
        else if (arg.find("--branch=") == 0) opts.branch = arg.substr(9);
        else if (arg.find("--side=") == 0) opts.side = std::stoi(arg.substr(7));
        else if (arg.find("--format=") == 0) opts.format = arg.substr(9);
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--help") { printUsage(); exit(0); }
        else { std::cerr << "Unknown option: " << arg << "\n"; printUsage(); exit(1); }
    }
    return opts;
}

// One line per row; "." unreachable, "~" water, "X" enemy, "@" start,
// otherwise the cost (capped at 9)
void printGrid(const Scenario& scenario, const MovementRange& range,
               HexCoord start, PlayerSide side) {
    const MapBounds& b = scenario.map.bounds();
    for (int r = 0; r < b.rows; ++r) {
        for (int c = 0; c < b.columns; ++c) {
            HexCoord hc{c, r};
            char ch = '.';
            bool enemy = false;
            for (const auto& u : scenario.units) {
                if (u.position == hc && u.side != side) enemy = true;
            }
            auto it = range.find(hc);
            if (hc == start) ch = '@';
            else if (enemy) ch = 'X';
            else if (scenario.map.at(hc).terrain == Terrain::WATER) ch = '~';
            else if (it != range.end()) ch = static_cast<char>('0' + std::min(it->second, 9));
            std::cout << ch << (c + 1 < b.columns ? " " : "");
        }
        std::cout << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options opts = parseArgs(argc, argv);

    if (opts.scenarioPath.empty()) {
        std::cerr << "Missing --scenario\n";
        printUsage();
        return 1;
    }

    try {
        Scenario scenario = loadScenarioFromFile(opts.scenarioPath);

        Unit mover;
        if (!opts.unitId.empty()) {
            const Unit* u = findUnit(scenario, opts.unitId);
            if (!u) {
                std::cerr << "No unit with id " << opts.unitId << " in scenario\n";
                return 1;
            }
            mover = *u;
        }
        if (opts.column >= 0) mover.position.column = opts.column;
        if (opts.row >= 0) mover.position.row = opts.row;
        if (opts.allowance >= 0) mover.movementAllowance = opts.allowance;
        if (!opts.branch.empty()) mover.branch = branchFromString(opts.branch);
        if (opts.side != 0) mover.side = playerSideFromNumber(opts.side);

        if (opts.verbose) {
            std::cerr << "Scenario: " << scenario.title
                      << " (" << scenario.map.bounds().columns << "x"
                      << scenario.map.bounds().rows << ", "
                      << scenario.units.size() << " units)\n"
                      << "Start: " << mover.position.key()
                      << "  allowance: " << mover.movementAllowance
                      << "  arm: " << branchName(mover.branch)
                      << "  player: " << playerNumber(mover.side) << "\n";
        }

        // The mover's own record must match any overrides, or it can show
        // up as an enemy of itself
        std::vector<Unit> units = unitsWith(scenario, mover);
        MovementRange range = calculateMovementRange(mover, scenario.map, units);

        if (opts.verbose) {
            std::cerr << "Reachable hexes: "
                      << reachableDestinations(range, mover.position).size() << "\n";
        }

        if (opts.format == "grid") {
            printGrid(scenario, range, mover.position, mover.side);
        } else {
            std::cout << movementRangeToJson(range) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

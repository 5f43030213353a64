#pragma once

#include "hw/enums.h"
#include "hw/hex_coord.h"
#include <string>

namespace hw {

struct Unit {
    std::string id;
    PlayerSide side = PlayerSide::PLAYER_ONE;
    HexCoord position{};
    int movementAllowance = 0;
    Branch branch = Branch::INFANTRY;
    UnitStatus status = UnitStatus::AVAILABLE;
    int combatStrength = 0;
};

} // namespace hw

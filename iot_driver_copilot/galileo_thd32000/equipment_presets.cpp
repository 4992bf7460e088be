#include "equipment_presets.h"

static Range between(double lo, double hi) { return Range{true, lo, true, hi}; }
static Range at_most(double hi) { return Range{false, 0.0, true, hi}; }
static const ChannelLimits kNoLimits = {Range{false, 0.0, false, 0.0}, Range{false, 0.0, false, 0.0}};

const std::vector<EquipmentPreset>& equipment_presets() {
    static const std::vector<EquipmentPreset> presets = {
        {"HELADERA", {between(3, 7), between(2, 8)}, false, kNoLimits, 5.0},
        {"FREEZER", {at_most(-17), at_most(-15)}, false, kNoLimits, -18.0},
        {"ESTUFA 30-35", {between(31.5, 33.5), between(30, 35)}, false, kNoLimits, 32.5},
        {"ESTUFA 20-25", {between(21.5, 23.5), between(20, 25)}, false, kNoLimits, 22.5},
        {"AREAS CALIFICADAS", {between(17, 23), between(15, 25)}, true, {at_most(62), at_most(65)}, 20.0},
        {"AREAS NO CALIFICADAS", {between(17, 23), between(15, 25)}, true, {at_most(67), at_most(70)}, 20.0},
    };
    return presets;
}

const EquipmentPreset* find_preset(const std::string& name) {
    for (const EquipmentPreset& p : equipment_presets()) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

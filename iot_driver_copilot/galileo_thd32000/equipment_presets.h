#ifndef EQUIPMENT_PRESETS_H
#define EQUIPMENT_PRESETS_H

#include <string>
#include <vector>

// Either bound may be open.
struct Range {
    bool has_min;
    double min;
    bool has_max;
    double max;

    bool contains(double v) const {
        return (!has_min || v >= min) && (!has_max || v <= max);
    }
};

struct ChannelLimits {
    Range alert;
    Range action;
};

struct EquipmentPreset {
    std::string name;
    ChannelLimits temperature;
    bool has_humidity;
    ChannelLimits humidity;
    double nominal_temperature;   // used by the simulator
};

const std::vector<EquipmentPreset>& equipment_presets();

// nullptr when the name is unknown.
const EquipmentPreset* find_preset(const std::string& name);

#endif // EQUIPMENT_PRESETS_H

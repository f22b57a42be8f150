#pragma once
#include "geometry.hpp"
#include "nlohmann/json.hpp"

// Location ID of the depot inside route sequences.
constexpr int DEPOT_ID = 0;

struct PlannerConfig {
    double capacity_kg = 15.0;
    double speed_kmh = 60.0;
    double dispatch_min = 10.0;   // unloading time at each customer
    double reload_min = 20.0;     // emptying the truck at the depot
    double workday_min = 7 * 60.0;
    int fleet_size = 4;
    int max_days = 365;
    Point depot{0.0, 0.0};
};

PlannerConfig config_from_json(const nlohmann::json& fleet);

// Throws std::invalid_argument for a configuration that could never finish.
void validate_config(const PlannerConfig& config);

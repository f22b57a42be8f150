#include "config.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

using json = nlohmann::json;
using namespace std;

PlannerConfig config_from_json(const json& fleet) {
    PlannerConfig cfg;
    if (fleet.is_null()) return cfg;

    cfg.capacity_kg  = fleet.value("capacity_kg", cfg.capacity_kg);
    cfg.speed_kmh    = fleet.value("speed_kmh", cfg.speed_kmh);
    cfg.dispatch_min = fleet.value("dispatch_min", cfg.dispatch_min);
    cfg.reload_min   = fleet.value("reload_min", cfg.reload_min);
    cfg.workday_min  = fleet.value("workday_min", cfg.workday_min);
    cfg.fleet_size   = fleet.value("fleet_size", cfg.fleet_size);
    cfg.max_days     = fleet.value("max_days", cfg.max_days);
    return cfg;
}

static void require(bool ok, const string& what) {
    if (!ok) throw invalid_argument("invalid configuration: " + what);
}

void validate_config(const PlannerConfig& cfg) {
    require(cfg.fleet_size >= 1, "fleet_size must be at least 1");
    require(cfg.capacity_kg > 0.0, "capacity_kg must be positive");
    require(cfg.speed_kmh > 0.0, "speed_kmh must be positive");
    require(cfg.workday_min > 0.0, "workday_min must be positive");
    require(cfg.dispatch_min >= 0.0, "dispatch_min must not be negative");
    require(cfg.reload_min >= 0.0, "reload_min must not be negative");
    require(cfg.max_days >= 1, "max_days must be at least 1");
    require(isfinite(cfg.depot.x) && isfinite(cfg.depot.y), "depot coordinates must be finite");
}

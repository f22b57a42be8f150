#include "vehicle.hpp"
#include "config.hpp"

bool Vehicle::at_depot() const {
    return location_id == DEPOT_ID;
}

Vehicle make_vehicle(int id, const PlannerConfig& config) {
    Vehicle v;
    v.id = id;
    v.route = {DEPOT_ID};
    v.location_id = DEPOT_ID;
    v.location = config.depot;
    return v;
}

double drive_to(Vehicle& v, int location_id, const Point& where, const PlannerConfig& config) {
    double leg = distance(v.location, where);
    v.elapsed_min += travel_time(leg, config.speed_kmh);
    v.distance_km += leg;
    v.route.push_back(location_id);
    v.location_id = location_id;
    v.location = where;
    return leg;
}

// Not checked against the workday: once triggered the reload always happens,
// even if it ends past workday_min.
void reload_at_depot(Vehicle& v, const PlannerConfig& config) {
    drive_to(v, DEPOT_ID, config.depot, config);
    v.elapsed_min += config.reload_min;
    v.load_kg = 0.0;
}

// Also unconditional; the last leg home may end past workday_min.
void return_to_depot(Vehicle& v, const PlannerConfig& config) {
    if (v.at_depot()) return;
    drive_to(v, DEPOT_ID, config.depot, config);
}

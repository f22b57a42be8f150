#pragma once
#include "geometry.hpp"
#include <vector>

struct PlannerConfig;

// One truck for one operating day. Nothing here survives into the next day.
struct Vehicle {
    int id;                 // 1..fleet_size
    std::vector<int> route; // location IDs, starts at the depot
    double load_kg = 0.0;
    double elapsed_min = 0.0;
    double distance_km = 0.0;
    int location_id;
    Point location;

    bool at_depot() const;
};

Vehicle make_vehicle(int id, const PlannerConfig& config);

// Drives one leg and appends the destination to the route. Returns the leg length.
double drive_to(Vehicle& v, int location_id, const Point& where, const PlannerConfig& config);

// Back to the depot to empty the truck.
void reload_at_depot(Vehicle& v, const PlannerConfig& config);

// Day-end closure, no-op if the vehicle already stands at the depot.
void return_to_depot(Vehicle& v, const PlannerConfig& config);

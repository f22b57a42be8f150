#pragma once
#include <vector>

struct DeliveryRecord {
    int day;
    int vehicle_id;
    int customer_id;
    double arrival_min;
    double departure_min;
    double leg_distance_km;
};

struct DailyMetric {
    int day;
    int vehicle_id;
    double distance_km;
    double time_min;
};

// Stops visited by one vehicle on one day, depot (0) first and last.
struct VehicleRoute {
    int day;
    int vehicle_id;
    std::vector<int> stops;
};

struct DayPlan {
    int day = 0;
    std::vector<DeliveryRecord> deliveries;
    std::vector<DailyMetric> metrics;
    std::vector<VehicleRoute> routes;
};

struct Schedule {
    int days_used = 0;
    std::vector<DeliveryRecord> deliveries;
    std::vector<DailyMetric> metrics;
    std::vector<VehicleRoute> routes;
};

#include "report.hpp"
#include "geometry.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>

using json = nlohmann::json;
using namespace std;

json schedule_to_json(const Schedule& schedule)
{
    json out;
    out["deliveries"] = json::array();
    out["metrics"] = json::array();
    out["routes"] = json::array();

    for (auto& d : schedule.deliveries) {
        out["deliveries"].push_back({
            {"day", d.day},
            {"vehicle", d.vehicle_id},
            {"customer", d.customer_id},
            {"arrival_min", d.arrival_min},
            {"departure_min", d.departure_min},
            {"leg_distance_km", d.leg_distance_km}
        });
    }

    double total_km = 0.0, total_min = 0.0;
    for (auto& m : schedule.metrics) {
        out["metrics"].push_back({
            {"day", m.day},
            {"vehicle", m.vehicle_id},
            {"distance_km", m.distance_km},
            {"time_min", m.time_min}
        });
        total_km += m.distance_km;
        total_min += m.time_min;
    }

    for (auto& r : schedule.routes) {
        json route;
        route["day"] = r.day;
        route["vehicle"] = r.vehicle_id;
        route["stops"] = r.stops;
        out["routes"].push_back(route);
    }

    out["summary"] = {
        {"days", schedule.days_used},
        {"deliveries", schedule.deliveries.size()},
        {"total_distance_km", round_to(total_km, 2)},
        {"total_time_min", round_to(total_min, 1)}
    };
    return out;
}

bool write_report(const string& filename, const Schedule& schedule)
{
    ofstream out_file(filename);
    if (!out_file) {
        cerr << "Failed to open output file " << filename << "\n";
        return false;
    }

    out_file << schedule_to_json(schedule).dump(2);
    return true;
}

void print_tables(ostream& out, const Schedule& schedule)
{
    out << fixed;

    out << setw(5) << "day" << setw(9) << "vehicle" << setw(10) << "customer"
        << setw(13) << "arrival_min" << setw(15) << "departure_min"
        << setw(17) << "leg_distance_km" << "\n";
    for (auto& d : schedule.deliveries) {
        out << setw(5) << d.day << setw(9) << d.vehicle_id << setw(10) << d.customer_id
            << setprecision(1) << setw(13) << d.arrival_min << setw(15) << d.departure_min
            << setprecision(2) << setw(17) << d.leg_distance_km << "\n";
    }

    out << "\n";
    out << setw(5) << "day" << setw(9) << "vehicle" << setw(13) << "distance_km"
        << setw(10) << "time_min" << "\n";
    for (auto& m : schedule.metrics) {
        out << setw(5) << m.day << setw(9) << m.vehicle_id
            << setprecision(2) << setw(13) << m.distance_km
            << setprecision(1) << setw(10) << m.time_min << "\n";
    }

    out << defaultfloat;
}

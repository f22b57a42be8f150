#pragma once

struct Point {
    double x;
    double y;
};

// km
double distance(const Point& a, const Point& b);

// minutes needed to cover distance_km at speed_kmh
double travel_time(double distance_km, double speed_kmh);

double round_to(double value, int decimals);

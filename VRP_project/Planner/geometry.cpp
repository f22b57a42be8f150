#include "geometry.hpp"
#include <cmath>

double distance(const Point& a, const Point& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

double travel_time(double distance_km, double speed_kmh) {
    return distance_km / speed_kmh * 60.0;
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

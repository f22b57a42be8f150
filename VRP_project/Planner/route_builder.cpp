#include "route_builder.hpp"
#include "geometry.hpp"

using namespace std;

Candidate evaluate_candidate(const Vehicle& v, const CustomerLedger& ledger, int idx,
                             const PlannerConfig& config)
{
    const Customer& c = ledger.customer(idx);

    Candidate cand;
    cand.customer_idx = idx;
    cand.leg_km = distance(v.location, c.location);
    cand.leg_min = travel_time(cand.leg_km, config.speed_kmh);
    double back_min = travel_time(distance(c.location, config.depot), config.speed_kmh);
    cand.cost_min = cand.leg_min + config.dispatch_min + back_min;
    return cand;
}

optional<Candidate> select_next_customer(const Vehicle& v, const CustomerLedger& ledger,
                                         const PlannerConfig& config)
{
    optional<Candidate> best;

    for (int i = 0; i < ledger.size(); i++) {
        if (ledger.is_served(i)) continue;
        if (v.load_kg + ledger.customer(i).weight > config.capacity_kg) continue;

        Candidate cand = evaluate_candidate(v, ledger, i, config);
        if (v.elapsed_min + cand.cost_min > config.workday_min) continue;

        if (!best || cand.cost_min < best->cost_min) best = cand;
    }
    return best;
}

DeliveryRecord commit_delivery(Vehicle& v, CustomerLedger& ledger, const Candidate& pick,
                               int day, const PlannerConfig& config)
{
    const Customer& c = ledger.customer(pick.customer_idx);

    double arrival = v.elapsed_min + pick.leg_min;
    double departure = arrival + config.dispatch_min;

    ledger.mark_served(pick.customer_idx, day, arrival, departure);

    v.route.push_back(c.id);
    v.load_kg += c.weight;
    v.elapsed_min = departure;
    v.distance_km += pick.leg_km;
    v.location_id = c.id;
    v.location = c.location;

    return DeliveryRecord{day, v.id, c.id, round_to(arrival, 1), round_to(departure, 1),
                          round_to(pick.leg_km, 2)};
}

bool reload_if_full(Vehicle& v, const CustomerLedger& ledger, const PlannerConfig& config) {
    optional<double> lightest = ledger.min_unserved_weight();
    if (!lightest) return false;
    if (v.load_kg + *lightest <= config.capacity_kg) return false;

    reload_at_depot(v, config);
    return true;
}

void build_route(Vehicle& v, CustomerLedger& ledger, int day, const PlannerConfig& config,
                 vector<DeliveryRecord>& deliveries)
{
    while (!ledger.all_served()) {
        optional<Candidate> pick = select_next_customer(v, ledger, config);
        if (!pick) break;

        deliveries.push_back(commit_delivery(v, ledger, *pick, day, config));
        reload_if_full(v, ledger, config);
    }
}

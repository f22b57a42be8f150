#pragma once
#include "config.hpp"
#include "ledger.hpp"
#include "records.hpp"
#include "vehicle.hpp"
#include <optional>
#include <vector>

struct Candidate {
    int customer_idx;
    double cost_min;   // out + dispatch + hypothetical way back
    double leg_km;
    double leg_min;
};

/*
 * Cost of serving customer idx next from where v stands:
 *   travel(v -> c) + dispatch + travel(c -> depot).
 * The return term is only charged, never driven; it keeps the truck from
 * wandering somewhere it could not come back from within the workday.
 */
Candidate evaluate_candidate(const Vehicle& v, const CustomerLedger& ledger, int idx,
                             const PlannerConfig& config);

// Cheapest unserved customer that fits the remaining capacity and workday.
// Scans in ledger order and keeps the first of equal costs.
std::optional<Candidate> select_next_customer(const Vehicle& v, const CustomerLedger& ledger,
                                              const PlannerConfig& config);

DeliveryRecord commit_delivery(Vehicle& v, CustomerLedger& ledger, const Candidate& pick,
                               int day, const PlannerConfig& config);

// Sends v home to unload when not even the lightest remaining customer fits.
bool reload_if_full(Vehicle& v, const CustomerLedger& ledger, const PlannerConfig& config);

// Extends v's route until nothing feasible is left for it today.
// Does not close the route; the day scheduler does that.
void build_route(Vehicle& v, CustomerLedger& ledger, int day, const PlannerConfig& config,
                 std::vector<DeliveryRecord>& deliveries);

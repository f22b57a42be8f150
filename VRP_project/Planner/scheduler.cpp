#include "scheduler.hpp"
#include "geometry.hpp"
#include "route_builder.hpp"
#include "vehicle.hpp"
#include <ostream>
#include <sstream>

using namespace std;

static string describe(const vector<int>& ids) {
    ostringstream out;
    for (int i = 0; i < (int)ids.size(); i++) {
        if (i > 0) out << ", ";
        out << ids[i];
    }
    return out.str();
}

vector<int> find_unservable_customers(const CustomerLedger& ledger, const PlannerConfig& config) {
    vector<int> ids;
    Vehicle probe = make_vehicle(0, config);

    for (int i = 0; i < ledger.size(); i++) {
        if (ledger.is_served(i)) continue;
        const Customer& c = ledger.customer(i);
        if (c.weight > config.capacity_kg) {
            ids.push_back(c.id);
            continue;
        }
        Candidate alone = evaluate_candidate(probe, ledger, i, config);
        if (alone.cost_min > config.workday_min) ids.push_back(c.id);
    }
    return ids;
}

DayPlan schedule_day(CustomerLedger& ledger, int day, const PlannerConfig& config) {
    DayPlan plan;
    plan.day = day;

    for (int id = 1; id <= config.fleet_size; id++) {
        Vehicle v = make_vehicle(id, config);

        build_route(v, ledger, day, config, plan.deliveries);
        return_to_depot(v, config);

        plan.metrics.push_back({day, v.id, round_to(v.distance_km, 2), round_to(v.elapsed_min, 1)});
        plan.routes.push_back({day, v.id, v.route});
    }
    return plan;
}

Schedule plan_all_days(CustomerLedger& ledger, const PlannerConfig& config, ostream* log) {
    validate_config(config);

    Schedule schedule;
    int day = 1;

    while (!ledger.all_served()) {
        if (day > config.max_days) {
            vector<int> left = ledger.unserved_ids();
            throw SchedulingError("no complete schedule within " + to_string(config.max_days) +
                                  " days, unserved customers: " + describe(left),
                                  left, day - 1);
        }

        if (log) *log << "--- Planning day " << day << " ---\n";

        int before = ledger.unserved_count();
        DayPlan plan = schedule_day(ledger, day, config);

        schedule.deliveries.insert(schedule.deliveries.end(), plan.deliveries.begin(), plan.deliveries.end());
        schedule.metrics.insert(schedule.metrics.end(), plan.metrics.begin(), plan.metrics.end());
        schedule.routes.insert(schedule.routes.end(), plan.routes.begin(), plan.routes.end());
        schedule.days_used = day;

        int served_today = before - ledger.unserved_count();
        if (log)
            *log << "Day " << day << ": served " << served_today
                 << ", remaining " << ledger.unserved_count() << "\n";

        if (served_today == 0) {
            vector<int> left = ledger.unserved_ids();
            throw SchedulingError("day " + to_string(day) +
                                  " served nobody, customers can never be served: " + describe(left),
                                  left, day);
        }
        day++;
    }
    return schedule;
}

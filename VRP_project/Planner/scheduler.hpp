#pragma once
#include "config.hpp"
#include "ledger.hpp"
#include "records.hpp"
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Raised when the remaining customers can never be served.
class SchedulingError : public std::runtime_error {
public:
    SchedulingError(const std::string& what, std::vector<int> unserved, int day)
        : std::runtime_error(what), unserved_(std::move(unserved)), day_(day) {}

    const std::vector<int>& unserved_ids() const { return unserved_; }
    int day() const { return day_; }

private:
    std::vector<int> unserved_;
    int day_;
};

// Customers no vehicle could serve even alone on an empty day.
std::vector<int> find_unservable_customers(const CustomerLedger& ledger, const PlannerConfig& config);

// Runs one operating day over a fresh fleet, vehicles strictly in order.
DayPlan schedule_day(CustomerLedger& ledger, int day, const PlannerConfig& config);

/*
 * Repeats schedule_day until every customer is served.
 * Throws SchedulingError if a whole day serves nobody (every following day
 * would start from the same state) or if config.max_days is exhausted.
 * Progress lines go to log when one is given.
 */
Schedule plan_all_days(CustomerLedger& ledger, const PlannerConfig& config,
                       std::ostream* log = nullptr);

#pragma once
#include "geometry.hpp"
#include <optional>
#include <vector>

struct Customer {
    int id;
    Point location;
    double weight; // kg
};

struct ServiceState {
    bool served = false;
    std::optional<int> assigned_day;
    double arrival_min = 0.0;
    double departure_min = 0.0;
};

/*
 * Immutable customer records plus their mutable service state.
 * Customers are kept sorted by ID, which is the order every scan uses,
 * so ties between equally good candidates always go to the lowest ID.
 * A customer is served exactly once; its state is frozen afterwards.
 */
class CustomerLedger {
public:
    explicit CustomerLedger(std::vector<Customer> customers);

    int size() const { return (int)customers_.size(); }
    int unserved_count() const { return unserved_; }
    bool all_served() const { return unserved_ == 0; }

    const Customer& customer(int idx) const;
    const ServiceState& state(int idx) const;
    bool is_served(int idx) const { return state(idx).served; }

    // Index of the customer with this ID, or -1.
    int index_of(int customer_id) const;

    void mark_served(int idx, int day, double arrival_min, double departure_min);

    // Lightest weight among unserved customers, empty once everyone is served.
    std::optional<double> min_unserved_weight() const;

    std::vector<int> unserved_ids() const;

private:
    std::vector<Customer> customers_;
    std::vector<ServiceState> states_;
    int unserved_;
};

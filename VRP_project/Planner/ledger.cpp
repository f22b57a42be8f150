#include "ledger.hpp"
#include "config.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

using namespace std;

CustomerLedger::CustomerLedger(vector<Customer> customers)
    : customers_(move(customers)), unserved_(0)
{
    sort(customers_.begin(), customers_.end(),
         [](const Customer& a, const Customer& b) { return a.id < b.id; });

    for (int i = 0; i < (int)customers_.size(); i++) {
        const Customer& c = customers_[i];
        if (c.id <= DEPOT_ID)
            throw invalid_argument("customer id " + to_string(c.id) + " must be positive");
        if (i > 0 && customers_[i - 1].id == c.id)
            throw invalid_argument("duplicate customer id " + to_string(c.id));
        if (!(c.weight >= 0.0) || !isfinite(c.weight))
            throw invalid_argument("customer " + to_string(c.id) + " has an invalid weight");
        if (!isfinite(c.location.x) || !isfinite(c.location.y))
            throw invalid_argument("customer " + to_string(c.id) + " has invalid coordinates");
    }

    states_.assign(customers_.size(), ServiceState{});
    unserved_ = (int)customers_.size();
}

const Customer& CustomerLedger::customer(int idx) const {
    if (idx < 0 || idx >= size())
        throw logic_error("customer index " + to_string(idx) + " out of range");
    return customers_[idx];
}

const ServiceState& CustomerLedger::state(int idx) const {
    if (idx < 0 || idx >= size())
        throw logic_error("customer index " + to_string(idx) + " out of range");
    return states_[idx];
}

int CustomerLedger::index_of(int customer_id) const {
    auto it = lower_bound(customers_.begin(), customers_.end(), customer_id,
                          [](const Customer& c, int id) { return c.id < id; });
    if (it == customers_.end() || it->id != customer_id) return -1;
    return (int)(it - customers_.begin());
}

void CustomerLedger::mark_served(int idx, int day, double arrival_min, double departure_min) {
    if (idx < 0 || idx >= size())
        throw logic_error("customer index " + to_string(idx) + " out of range");

    ServiceState& st = states_[idx];
    if (st.served)
        throw logic_error("customer " + to_string(customers_[idx].id) + " is already served");

    st.served = true;
    st.assigned_day = day;
    st.arrival_min = arrival_min;
    st.departure_min = departure_min;
    unserved_--;
}

optional<double> CustomerLedger::min_unserved_weight() const {
    optional<double> best;
    for (int i = 0; i < size(); i++) {
        if (states_[i].served) continue;
        if (!best || customers_[i].weight < *best) best = customers_[i].weight;
    }
    return best;
}

vector<int> CustomerLedger::unserved_ids() const {
    vector<int> ids;
    for (int i = 0; i < size(); i++)
        if (!states_[i].served) ids.push_back(customers_[i].id);
    return ids;
}

#include "ledger.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

static CustomerLedger three_customers() {
    std::vector<Customer> customers = {{3, {0, 30}, 5}, {1, {0, 10}, 8}, {2, {0, 20}, 2}};
    return CustomerLedger(customers);
}

TEST(Ledger, KeepsCustomersSortedById) {
    CustomerLedger ledger = three_customers();
    ASSERT_EQ(ledger.size(), 3);
    EXPECT_EQ(ledger.customer(0).id, 1);
    EXPECT_EQ(ledger.customer(1).id, 2);
    EXPECT_EQ(ledger.customer(2).id, 3);
    EXPECT_EQ(ledger.index_of(3), 2);
    EXPECT_EQ(ledger.index_of(42), -1);
}

TEST(Ledger, StartsWithEverybodyUnserved) {
    CustomerLedger ledger = three_customers();
    EXPECT_EQ(ledger.unserved_count(), 3);
    EXPECT_FALSE(ledger.all_served());
    for (int i = 0; i < ledger.size(); i++) {
        EXPECT_FALSE(ledger.state(i).served);
        EXPECT_FALSE(ledger.state(i).assigned_day.has_value());
    }
}

TEST(Ledger, MarkServedRecordsDayAndTimes) {
    CustomerLedger ledger = three_customers();
    int idx = ledger.index_of(2);
    ledger.mark_served(idx, 4, 12.5, 22.5);

    const ServiceState& st = ledger.state(idx);
    EXPECT_TRUE(st.served);
    EXPECT_EQ(st.assigned_day, 4);
    EXPECT_DOUBLE_EQ(st.arrival_min, 12.5);
    EXPECT_DOUBLE_EQ(st.departure_min, 22.5);
    EXPECT_EQ(ledger.unserved_count(), 2);
    EXPECT_EQ(ledger.unserved_ids(), (std::vector<int>{1, 3}));
}

TEST(Ledger, ServingTwiceIsRejected) {
    CustomerLedger ledger = three_customers();
    ledger.mark_served(0, 1, 10, 20);
    EXPECT_THROW(ledger.mark_served(0, 2, 30, 40), std::logic_error);

    EXPECT_EQ(ledger.state(0).assigned_day, 1);
    EXPECT_DOUBLE_EQ(ledger.state(0).arrival_min, 10);
    EXPECT_EQ(ledger.unserved_count(), 2);
}

TEST(Ledger, MinUnservedWeight) {
    CustomerLedger ledger = three_customers();
    EXPECT_EQ(ledger.min_unserved_weight(), 2.0);

    ledger.mark_served(ledger.index_of(2), 1, 0, 0);
    EXPECT_EQ(ledger.min_unserved_weight(), 5.0);

    ledger.mark_served(ledger.index_of(1), 1, 0, 0);
    ledger.mark_served(ledger.index_of(3), 1, 0, 0);
    EXPECT_FALSE(ledger.min_unserved_weight().has_value());
    EXPECT_TRUE(ledger.all_served());
}

TEST(Ledger, RejectsBadRecords) {
    std::vector<Customer> duplicate = {{1, {0, 0}, 1}, {1, {1, 1}, 2}};
    std::vector<Customer> depot_id = {{0, {0, 0}, 1}};
    std::vector<Customer> negative_id = {{-5, {0, 0}, 1}};
    std::vector<Customer> negative_weight = {{1, {0, 0}, -1}};

    EXPECT_THROW(CustomerLedger{duplicate}, std::invalid_argument);
    EXPECT_THROW(CustomerLedger{depot_id}, std::invalid_argument);
    EXPECT_THROW(CustomerLedger{negative_id}, std::invalid_argument);
    EXPECT_THROW(CustomerLedger{negative_weight}, std::invalid_argument);
}

TEST(Ledger, OutOfRangeIndex) {
    CustomerLedger ledger = three_customers();
    EXPECT_THROW(ledger.customer(3), std::logic_error);
    EXPECT_THROW(ledger.mark_served(-1, 1, 0, 0), std::logic_error);
}

TEST(Ledger, EmptyLedgerIsComplete) {
    CustomerLedger ledger(std::vector<Customer>{});
    EXPECT_TRUE(ledger.all_served());
    EXPECT_FALSE(ledger.min_unserved_weight().has_value());
}

#include "report.hpp"
#include <gtest/gtest.h>
#include <sstream>

static Schedule two_day_schedule() {
    Schedule s;
    s.days_used = 2;
    s.deliveries = {{1, 1, 1, 10.0, 20.0, 10.0}, {2, 1, 2, 25.0, 35.0, 25.0}};
    s.metrics = {{1, 1, 20.0, 30.0}, {2, 1, 50.0, 60.0}};
    s.routes = {{1, 1, {0, 1, 0}}, {2, 1, {0, 2, 0}}};
    return s;
}

TEST(Report, JsonDocument) {
    nlohmann::json out = schedule_to_json(two_day_schedule());

    ASSERT_EQ(out["deliveries"].size(), 2u);
    EXPECT_EQ(out["deliveries"][1]["day"], 2);
    EXPECT_EQ(out["deliveries"][1]["customer"], 2);
    EXPECT_DOUBLE_EQ(out["deliveries"][1]["arrival_min"].get<double>(), 25.0);
    EXPECT_DOUBLE_EQ(out["deliveries"][0]["leg_distance_km"].get<double>(), 10.0);

    ASSERT_EQ(out["metrics"].size(), 2u);
    EXPECT_EQ(out["metrics"][0]["vehicle"], 1);
    EXPECT_DOUBLE_EQ(out["metrics"][1]["time_min"].get<double>(), 60.0);

    ASSERT_EQ(out["routes"].size(), 2u);
    EXPECT_EQ(out["routes"][1]["stops"].get<std::vector<int>>(), (std::vector<int>{0, 2, 0}));

    EXPECT_EQ(out["summary"]["days"], 2);
    EXPECT_EQ(out["summary"]["deliveries"], 2);
    EXPECT_DOUBLE_EQ(out["summary"]["total_distance_km"].get<double>(), 70.0);
    EXPECT_DOUBLE_EQ(out["summary"]["total_time_min"].get<double>(), 90.0);
}

TEST(Report, EmptySchedule) {
    nlohmann::json out = schedule_to_json(Schedule{});
    EXPECT_TRUE(out["deliveries"].is_array());
    EXPECT_TRUE(out["deliveries"].empty());
    EXPECT_EQ(out["summary"]["days"], 0);
}

TEST(Report, TextTables) {
    std::ostringstream out;
    print_tables(out, two_day_schedule());
    std::string text = out.str();

    EXPECT_NE(text.find("arrival_min"), std::string::npos);
    EXPECT_NE(text.find("distance_km"), std::string::npos);
    EXPECT_NE(text.find("35.0"), std::string::npos);
    EXPECT_NE(text.find("25.00"), std::string::npos);
    EXPECT_NE(text.find("50.00"), std::string::npos);
}

#pragma once
#include "records.hpp"
#include "nlohmann/json.hpp"
#include <ostream>
#include <string>

nlohmann::json schedule_to_json(const Schedule& schedule);

bool write_report(const std::string& filename, const Schedule& schedule);

// Delivery table then metrics table, fixed width.
void print_tables(std::ostream& out, const Schedule& schedule);

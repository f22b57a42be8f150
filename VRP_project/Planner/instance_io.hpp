#pragma once
#include "config.hpp"
#include "ledger.hpp"
#include "nlohmann/json.hpp"
#include <istream>
#include <string>
#include <vector>

struct Instance {
    PlannerConfig config;
    std::vector<Customer> customers;
};

bool parse_instance(const nlohmann::json& j, Instance& inst);
bool load_instance(const std::string& filename, Instance& inst);

// Spreadsheet export: header row, then "id,x,y,weight" per line.
bool parse_customers_csv(std::istream& in, std::vector<Customer>& customers);
bool load_customers_csv(const std::string& filename, std::vector<Customer>& customers);

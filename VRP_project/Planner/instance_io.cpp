#include "instance_io.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;
using namespace std;

bool parse_instance(const json& j, Instance& inst)
{
    if (!j.contains("customers")) {
        cerr << "No customers found in instance\n";
        return false;
    }

    try {
        inst.config = config_from_json(j.contains("fleet") ? j["fleet"] : json());

        if (j.contains("depot")) {
            inst.config.depot.x = j["depot"].value("x", 0.0);
            inst.config.depot.y = j["depot"].value("y", 0.0);
        }

        inst.customers.clear();
        for (auto &jc : j["customers"]) {
            Customer c;
            c.id = jc.at("id");
            c.location.x = jc.at("x");
            c.location.y = jc.at("y");
            c.weight = jc.at("weight");
            inst.customers.push_back(c);
        }
    } catch (const json::exception& e) {
        cerr << "Malformed instance: " << e.what() << "\n";
        return false;
    }

    return true;
}

bool load_instance(const string& filename, Instance& inst)
{
    ifstream fin(filename);
    if (!fin) {
        cerr << "Could not open instance file: " << filename << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
    } catch (const exception& e) {
        cerr << "Error parsing JSON: " << e.what() << "\n";
        return false;
    }

    return parse_instance(j, inst);
}

static bool parse_row(const string& line, Customer& c)
{
    stringstream row(line);
    string cell;
    vector<string> cells;
    while (getline(row, cell, ','))
        cells.push_back(cell);
    if (cells.size() < 4) return false;

    try {
        size_t used = 0;
        c.id = stoi(cells[0], &used);
        if (cells[0].find_first_not_of(" \t\r", used) != string::npos) return false;
        c.location.x = stod(cells[1]);
        c.location.y = stod(cells[2]);
        c.weight = stod(cells[3]);
    } catch (const exception&) {
        return false;
    }
    return true;
}

bool parse_customers_csv(istream& in, vector<Customer>& customers)
{
    string line;
    if (!getline(in, line)) {
        cerr << "Empty customer sheet\n";
        return false;
    }

    customers.clear();
    int line_no = 1;
    while (getline(in, line)) {
        line_no++;
        if (line.find_first_not_of(" \t\r") == string::npos) continue;

        Customer c;
        if (!parse_row(line, c)) {
            cerr << "Malformed customer row at line " << line_no << ": " << line << "\n";
            return false;
        }
        customers.push_back(c);
    }
    return true;
}

bool load_customers_csv(const string& filename, vector<Customer>& customers)
{
    ifstream fin(filename);
    if (!fin) {
        cerr << "Could not open customer sheet: " << filename << "\n";
        return false;
    }
    return parse_customers_csv(fin, customers);
}

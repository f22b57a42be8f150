#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "instance_io.hpp"
#include "ledger.hpp"
#include "report.hpp"
#include "scheduler.hpp"

using namespace std;

int main(int argc, char** argv) {
    if (argc != 3 && argc != 4) {
        cerr << "Usage: ./fleet_planner instance.json output.json [customers.csv]\n";
        return 1;
    }

    Instance inst;
    if (!load_instance(argv[1], inst)) {
        cerr << "Failed to load instance from " << argv[1] << "\n";
        return 1;
    }

    if (argc == 4 && !load_customers_csv(argv[3], inst.customers)) {
        cerr << "Failed to load customers from " << argv[3] << "\n";
        return 1;
    }

    cout << "Loaded " << inst.customers.size() << " customers\n";

    const PlannerConfig& cfg = inst.config;
    cout << "Fleet: " << cfg.fleet_size << " trucks of " << cfg.capacity_kg << " kg, "
         << cfg.workday_min << " min workday, depot at (" << cfg.depot.x << ", " << cfg.depot.y << ")\n";

    try {
        validate_config(cfg);
        CustomerLedger ledger(inst.customers);

        vector<int> unservable = find_unservable_customers(ledger, cfg);
        if (!unservable.empty()) {
            cerr << "Customers that no truck can ever serve:";
            for (int id : unservable) cerr << " " << id;
            cerr << "\n";
            return 1;
        }

        auto start_time = chrono::high_resolution_clock::now();

        Schedule schedule = plan_all_days(ledger, cfg, &cout);

        auto end_time = chrono::high_resolution_clock::now();
        auto duration = chrono::duration_cast<chrono::milliseconds>(end_time - start_time);

        cout << "Scheduling completed in " << duration.count() << " ms over "
             << schedule.days_used << " day(s)\n\n";

        print_tables(cout, schedule);

        if (!write_report(argv[2], schedule)) return 1;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    cout << "\nOutput written to " << argv[2] << "\n";
    return 0;
}

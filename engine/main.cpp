#include <iostream>
#include <fstream>
#include <string>
#include <chrono>
#include <stdexcept>
#include "config.hpp"
#include "events.hpp"
#include "nlohmann/json.hpp"

using json = nlohmann::json;
using namespace std;

int main(int argc, char* argv[]) {
    if (argc != 3 && argc != 4) {
        cerr << "Usage: " << argv[0] << " <input.json> <output.json> [config.json]\n";
        return 1;
    }

    EngineConfig cfg;
    if (argc == 4 && !load_config_file(argv[3], cfg)) {
        cerr << "Failed to load config from " << argv[3] << "\n";
        return 1;
    }

    try {
        apply_env_overrides(cfg);
    } catch (const invalid_argument& e) {
        cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    string config_error;
    if (!validate_config(cfg, config_error)) {
        cerr << "Invalid configuration: " << config_error << "\n";
        return 1;
    }

    HeuristicSolver solver(cfg);

    ifstream fin(argv[1]);
    if (!fin) {
        cerr << "Failed to open input file " << argv[1] << "\n";
        return 1;
    }

    json input;
    try {
        fin >> input;
    } catch (const exception& e) {
        cerr << "Error parsing input JSON: " << e.what() << "\n";
        return 1;
    }

    json output;
    if (input.is_object() && input.contains("events")) {
        if (!input["events"].is_array()) {
            cerr << "events must be an array\n";
            return 1;
        }
        cout << "Processing " << input["events"].size() << " events\n";

        output["results"] = json::array();
        for (const auto& event : input["events"]) {
            auto start_time = chrono::high_resolution_clock::now();
            json result = process_event(solver, event, cout);
            auto end_time = chrono::high_resolution_clock::now();
            result["processing_time"] =
                chrono::duration<double, milli>(end_time - start_time).count();
            output["results"].push_back(result);
        }
    } else {
        output = optimize_payload(solver, input, false, cout);
        if (output.contains("error")) {
            cerr << "Request rejected, see " << argv[2] << "\n";
        } else {
            cout << "Route with " << output["optimization_metrics"]["total_stops"]
                 << " stops, " << output["optimization_metrics"]["skipped_stops"]
                 << " skipped, feasible: " << output["is_feasible"] << "\n";
        }
    }

    ofstream out_file(argv[2]);
    if (!out_file) {
        cerr << "Failed to open output file " << argv[2] << "\n";
        return 1;
    }

    out_file << output.dump(2) << endl;
    out_file.close();

    cout << "Output written to " << argv[2] << "\n";
    return 0;
}

#include <bits/stdc++.h>
#include "src/worker/worker.h"
using namespace std;

int main(int argc, char* argv[]) {
    // Step 0: stdout carries responses, progress lines go to stderr
    set_log_stream(cerr);

    // Step 1: Load configuration
    // - oi_worker <config.json>: the file must exist and be valid
    // - oi_worker: ./config.json when present, built-in defaults otherwise
    Config config;
    try {
        if (argc >= 2) {
            config = read_config(argv[1]);
        } else if (filesystem::exists("config.json")) {
            config = read_config("config.json");
        } else {
            log_line("Worker", "No config.json found, using built-in defaults");
        }
    } catch (const ConfigError& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    // Step 2: Initialize worker (creates the managed temp tree)
    unique_ptr<Worker> worker;
    try {
        worker = make_unique<Worker>(config);
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    // Step 3: Serve requests, one JSON object per line in and out
    string line;
    while (getline(cin, line)) {
        if (line.find_first_not_of(" \t\r") == string::npos) continue;
        cout << worker->handle_line(line) << endl;
    }
    return 0;
}

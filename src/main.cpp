#include "main.h"
#include <readline/history.h>
#include <readline/readline.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include "Interpreter.h"

namespace fs = std::filesystem;
using namespace std;

fs::path get_or_create_cfg_path() {
    const char* home_env = getenv("HOME");
    fs::path cfg_path = home_env ? home_env : ".";

    for (auto path : config_dir) {
        cfg_path /= path;
    }

    if (!fs::exists(cfg_path)) {
        cout << "initializing cfg dir at " << cfg_path.string() << "\n";
        fs::create_directories(cfg_path);
    }

    return cfg_path;
}

void init_clusterset() {
    fs::path cfg_path = get_or_create_cfg_path();
    fs::path histpath = cfg_path / histfile;
    read_history(histpath.c_str());
}

void exit_clusterset() {
    fs::path cfg_path = get_or_create_cfg_path();
    fs::path histpath = cfg_path / histfile;
    write_history(histpath.c_str());
}

int main(int argc, char* argv[]) {
    /* optional first argument overrides the database directory */
    string_view database = argc > 1 ? string_view(argv[1]) : dbDir;

    Interpreter interpreter(database);

    /* initialize clusterset */
    init_clusterset();

    while (true) {
        char* line = readline("> ");
        if (line == nullptr) {
            break;
        }

        string command(line);
        free(line);

        if (command == "exit") {
            break;
        }

        if (!command.empty()) {
            add_history(command.c_str());
        }

        interpreter.processCommand(command);
    }

    /* cleanup clusterset
     * TODO: call on SIGTERM */
    exit_clusterset();

    return 0;
}

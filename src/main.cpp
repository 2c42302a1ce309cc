#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"
#include "utils.hpp"

static void print_usage() {
    std::cout << "Usage: semsearch [--config PATH] <command> [options]\n\n"
              << "Commands:\n"
              << "  init                        Write default config to ~/.semsearch\n"
              << "  status                      Show configuration and index size\n"
              << "  ingest --input FILE [--index NAME] [--batch-size N]\n"
              << "         [--strict] [--no-pipeline] [--json]\n"
              << "                              Rebuild the index from a JSON Lines file\n"
              << "  query [-q TEXT] [-k N] [--index NAME] [--json]\n"
              << "                              Search (interactive when -q is omitted)\n"
              << "  serve [--host H] [--port P] [--index NAME]\n"
              << "                              Start HTTP search server\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = semsearch::default_config_path();
    std::vector<std::string> rest;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            rest.push_back(a);
        }
    }

    if (rest.empty()) {
        print_usage();
        return 1;
    }

    std::string cmd = rest[0];
    std::vector<std::string> args(rest.begin() + 1, rest.end());

    if (cmd == "init") {
        return semsearch::cmd_init(config_path);
    }
    else if (cmd == "status") {
        return semsearch::cmd_status(config_path);
    }
    else if (cmd == "ingest") {
        return semsearch::cmd_ingest(config_path, args);
    }
    else if (cmd == "query") {
        return semsearch::cmd_query(config_path, args);
    }
    else if (cmd == "serve") {
        return semsearch::cmd_serve(config_path, args);
    }
    else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}

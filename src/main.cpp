#include <iostream>
#include <string>
#include <vector>
#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "gateway.hpp"

int main(int argc, char* argv[]) {
    if (argc < 2) {
        teamfs::run_cli(teamfs::Config::make_default(), "help", {});
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    std::string config_path = teamfs::default_config_path();
    teamfs::Config cfg = teamfs::Config::load(config_path);

    if (cmd == "serve") {
        std::string host = cfg.http.host;
        int port = cfg.http.port;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--host" && i + 1 < args.size()) {
                host = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                try {
                    port = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "[error] InvalidArgument: invalid port '" << args[i] << "'\n";
                    return 1;
                }
            }
        }
        return teamfs::cmd_serve(cfg, host, port);
    }
    else if (cmd == "config") {
        if (!args.empty() && args[0] == "--init") {
            try {
                cfg.save(config_path);
            } catch (const teamfs::StoreError& e) {
                std::cerr << "[error] " << e.code_name() << ": " << e.what() << "\n";
                return 1;
            }
            std::cerr << "[config] Wrote " << config_path << "\n";
        }
        std::cout << cfg.to_json().dump(2) << "\n";
        return 0;
    }
    return teamfs::run_cli(cfg, cmd, args);
}

#include "commands/Commands.hpp"
#include "commands/Config.hpp"
#include "commands/Service.hpp"
#include "logging/Log.hpp"

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

static int emit(const nlohmann::json& j, int code) {
    std::cout << j.dump() << std::endl;
    return code;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(std::cerr);
        return 1;
    }

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage(std::cerr);
        return 0;
    }

    // unknown commands are a logical failure, not a crash
    if (!is_known_command(cmd)) {
        return emit(failure("faculty-sim", "Unknown command: " + cmd), 0);
    }

    try {
        const AppConfig cfg = parse_config(argc - 1, argv + 1);
        logging::set_verbose(cfg.verbose);

        Service svc(cfg);
        return emit(run_command(cmd, svc, std::cin), 0);
    } catch (const std::exception& e) {
        return emit(failure("faculty-sim", e), 1);
    }
}

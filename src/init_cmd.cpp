#include "commands.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <iostream>

namespace semsearch {

int cmd_init(const std::string& config_path) {
    if (!fs::exists(config_path)) {
        Config cfg = Config::make_default();
        cfg.save(config_path);
        std::cout << "[init] Created config: " << config_path << "\n";
    } else {
        std::cout << "[init] Config already exists: " << config_path << "\n";
    }

    Config cfg = Config::load(config_path);
    auto data_dir = fs::path(cfg.store_path()).parent_path();
    if (!data_dir.empty()) {
        fs::create_directories(data_dir);
        std::cout << "[init] Data directory: " << data_dir.string() << "\n";
    }
    return 0;
}

} // namespace semsearch

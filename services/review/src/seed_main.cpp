#include "../include/sample_data.hpp"
#include "../../../shared/cpp/ticket_sdk/include/config.hpp"
#include "../../../shared/cpp/ticket_sdk/include/log.hpp"
#include <spdlog/spdlog.h>
#include <iostream>

int main() {
    AppConfig cfg = load_config();
    init_logging("seed", cfg.log);
    try {
        TicketStore store(cfg.store.db_path, cfg.store.busy_timeout_ms);
        int n = seed_sample_data(store);
        std::cout << "[OK] " << n << " sample tickets written to " << store.path() << "\n";
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("[seed] Error uploading data: {}", e.what());
        return 1;
    }
}

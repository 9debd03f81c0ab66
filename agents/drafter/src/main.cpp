#include "../include/worker.hpp"
#include "../../../shared/cpp/ticket_sdk/include/context.hpp"
#include "../../../shared/cpp/ticket_sdk/include/log.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>

static StopSignal* g_stop = nullptr;

static void on_signal(int) {
    if (g_stop) g_stop->request_stop();
}

int main() {
    AppConfig cfg = load_config();
    init_logging("drafter", cfg.log);

    try {
        AppContext ctx(cfg);
        g_stop = &ctx.stop();
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        DraftWorker worker(ctx.claims(), ctx.transitions(), ctx.retrieval(), ctx.drafter(), ctx.stop(),
                           ctx.config().worker);
        worker.run();
        g_stop = nullptr;
    } catch (const std::exception& e) {
        g_stop = nullptr;
        spdlog::critical("[drafter] fatal: {}", e.what());
        return 1;
    }
    spdlog::info("[drafter] shutdown complete");
    return 0;
}

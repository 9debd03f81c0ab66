#include "../include/config.hpp"
#include "../include/util.hpp"
#include <spdlog/spdlog.h>
#include <limits>
#include <stdexcept>
#include <unistd.h>

// Values outside [lo, hi] keep the default, like malformed ones.
static void read_int(const char* key, int& out, long lo = 1, long hi = std::numeric_limits<int>::max()) {
    try {
        auto v = getenv_long(key);
        if (!v) return;
        if (*v < lo || *v > hi) {
            spdlog::warn("[config] {}={} outside [{}, {}]; keeping {}", key, *v, lo, hi, out);
            return;
        }
        out = (int)*v;
    } catch (const std::invalid_argument& e) {
        spdlog::warn("[config] {}; keeping {}", e.what(), out);
    }
}

AppConfig load_config() {
    AppConfig c;
    c.store.db_path = getenv_or("TICKET_DB_PATH", c.store.db_path);
    c.store.index_db_path = getenv_or("INDEX_DB_PATH", c.store.index_db_path);

    std::string ollama = getenv_or("OLLAMA_URL", c.llm.ollama_url);
    c.llm.ollama_url = ollama;
    c.embed.ollama_url = ollama;
    c.llm.llm_model = getenv_or("DRAFT_LLM_MODEL", c.llm.llm_model);
    c.embed.embed_model = getenv_or("EMBED_MODEL", c.embed.embed_model);
    read_int("LLM_TIMEOUT_MS", c.llm.timeout_ms);
    read_int("EMBED_TIMEOUT_MS", c.embed.timeout_ms);

    c.worker.worker_id = getenv_or("WORKER_ID", "drafter-" + std::to_string(::getpid()));
    read_int("WORKER_POLL_MS", c.worker.poll_ms);
    read_int("WORKER_MAX_BACKOFF_MS", c.worker.max_backoff_ms);
    read_int("CLAIM_LEASE_S", c.worker.claim_lease_s, 0); // 0 disables lease expiry

    read_int("REVIEW_PORT", c.review.port, 1, 65535);

    c.log.file = getenv_or("LOG_FILE", c.log.file);
    c.log.level = getenv_or("LOG_LEVEL", c.log.level);
    return c;
}

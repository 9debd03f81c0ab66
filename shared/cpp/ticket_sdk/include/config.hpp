#pragma once
#include <cstddef>
#include <string>

struct StoreConfig {
    std::string db_path{"./data/tickets.db"};
    std::string index_db_path{"./data/index.db"};
    int busy_timeout_ms{15000};
};

struct EmbedConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"bge-m3"};
    int timeout_ms{120000};
};

struct LlmConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"mistral"};
    int timeout_ms{240000};
    double temperature{0.2};
};

struct WorkerConfig {
    std::string worker_id;
    int poll_ms{5000};
    int max_backoff_ms{60000};
    int claim_lease_s{900};
    int policy_k{3};
    int previous_k{5};
};

struct ReviewConfig {
    int port{7100};
    int default_limit{10};
    double rephrase_temperature{0.5};
};

struct LogConfig {
    std::string file{"./logs/app.log"};
    std::string level{"info"};
    std::size_t max_bytes{5 * 1024 * 1024};
    std::size_t max_files{10};
};

struct AppConfig {
    StoreConfig store;
    EmbedConfig embed;
    LlmConfig llm;
    WorkerConfig worker;
    ReviewConfig review;
    LogConfig log;
};

// Reads the environment once. Malformed numbers keep their default and are
// reported through spdlog.
AppConfig load_config();

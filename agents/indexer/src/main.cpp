#include "../include/ingest.hpp"
#include "../../../shared/cpp/ticket_sdk/include/config.hpp"
#include "../../../shared/cpp/ticket_sdk/include/log.hpp"
#include "../../../shared/cpp/ticket_sdk/include/retrieval.hpp"
#include <spdlog/spdlog.h>
#include <iostream>

static void usage() {
    std::cerr << "ticket_index usage:\n"
              << "  ingest-policy --dir <path> [--reset]\n"
              << "  ingest-resolved [--limit N] [--reset]\n"
              << "  query --index policy|previous-record --question \"...\" [--k N]\n";
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    AppConfig cfg = load_config();
    init_logging("indexer", cfg.log);

    try {
        VectorStore vectors(cfg.store.index_db_path);
        OllamaEmbedder embedder(cfg.embed);

        if (cmd == "ingest-policy") {
            PolicyIngestOptions opts;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--dir" && i + 1 < argc) opts.dir = argv[++i];
                else if (a == "--reset") opts.reset = true;
            }
            if (opts.dir.empty()) { usage(); return 2; }
            int n = ingest_policy(vectors, embedder, opts);
            std::cout << "[OK] Ingested policy chunks: " << n << "\n";
            return 0;
        } else if (cmd == "ingest-resolved") {
            ResolvedIngestOptions opts;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--limit" && i + 1 < argc) opts.limit = std::stoi(argv[++i]);
                else if (a == "--reset") opts.reset = true;
            }
            TicketStore tickets(cfg.store.db_path, cfg.store.busy_timeout_ms);
            int n = ingest_resolved(tickets, vectors, embedder, opts);
            std::cout << "[OK] Ingested resolved tickets: " << n << "\n";
            return 0;
        } else if (cmd == "query") {
            std::string index = kPolicyCollection;
            std::string question;
            int k = 3;
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--index" && i + 1 < argc) index = argv[++i];
                else if (a == "--question" && i + 1 < argc) question = argv[++i];
                else if (a == "--k" && i + 1 < argc) k = std::stoi(argv[++i]);
            }
            if (question.empty() || k < 1 || (index != kPolicyCollection && index != kPreviousRecordCollection)) {
                usage();
                return 2;
            }
            VectorSimilarityIndex idx(vectors, embedder, index);
            auto hits = RetrievalContextBuilder::retrieve(idx, question, k);
            std::cout << (index == kPolicyCollection ? render_policy_context(hits) : render_previous_context(hits))
                      << "\n";
            return 0;
        } else {
            usage();
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("[index] {}", e.what());
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}

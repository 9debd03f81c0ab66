#pragma once
#include "../../../shared/cpp/ticket_sdk/include/ticket_store.hpp"
#include "../../../shared/cpp/ticket_sdk/include/vector_index.hpp"
#include <filesystem>
#include <string>
#include <vector>

struct PolicyIngestOptions {
    std::filesystem::path dir;
    std::vector<std::string> exts{".md", ".txt"};
    std::vector<std::string> ignore_dirs{".git", ".svn", ".idea", ".vscode", "build", "out", "node_modules"};
    bool reset{false};
    int doc_chars{1200};
    int doc_overlap{200};
};

struct ResolvedIngestOptions {
    int limit{1000};
    bool reset{false};
};

// Policy documents -> "policy" collection. Returns the number of chunks written.
int ingest_policy(VectorStore& vectors, Embedder& embedder, const PolicyIngestOptions& opts);

// Completed tickets (issue text, with id and resolution as metadata) ->
// "previous-record" collection. Returns the number of tickets written.
int ingest_resolved(TicketStore& tickets, VectorStore& vectors, Embedder& embedder, const ResolvedIngestOptions& opts);

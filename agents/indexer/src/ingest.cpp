#include "../include/ingest.hpp"
#include "../../../shared/cpp/ticket_sdk/include/util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

int ingest_policy(VectorStore& vectors, Embedder& embedder, const PolicyIngestOptions& opts) {
    if (!std::filesystem::is_directory(opts.dir)) {
        throw std::invalid_argument("policy directory not found: " + opts.dir.string());
    }
    auto paths = list_files(opts.dir, opts.exts, opts.ignore_dirs);
    if (opts.reset) vectors.reset(kPolicyCollection);

    int total_chunks = 0;
    for (auto& p : paths) {
        auto text = read_text_file(p);
        if (text.empty()) continue;
        auto parts = chunk_text_paragraphs(text, opts.doc_chars, opts.doc_overlap);
        if (parts.empty()) continue;

        auto sha = sha1_file(p);
        std::vector<IndexedChunk> chunks;
        std::vector<std::vector<float>> embeddings;
        chunks.reserve(parts.size());
        embeddings.reserve(parts.size());
        for (auto& part : parts) {
            embeddings.push_back(embedder.embed(part));
            chunks.push_back({part, nlohmann::json{
                {"source_path", p.string()},
                {"filename", p.filename().string()},
                {"sha1", sha}
            }});
        }
        vectors.upsert_source(kPolicyCollection, p.string(), chunks, embeddings);
        spdlog::info("[index] {}: {} chunk(s)", p.filename().string(), parts.size());
        total_chunks += (int)parts.size();
    }
    return total_chunks;
}

int ingest_resolved(TicketStore& tickets, VectorStore& vectors, Embedder& embedder, const ResolvedIngestOptions& opts) {
    auto resolved = tickets.list_recent(Stage::Completed, opts.limit);
    if (opts.reset) vectors.reset(kPreviousRecordCollection);

    int written = 0;
    for (const auto& t : resolved) {
        if (trim(t.issue).empty()) continue;
        IndexedChunk chunk{t.issue, nlohmann::json{
            {"ticket_id", t.ticket_id},
            {"resolution", t.resolution.value_or("")}
        }};
        vectors.upsert_source(kPreviousRecordCollection, t.ticket_id, {chunk}, {embedder.embed(t.issue)});
        ++written;
    }
    spdlog::info("[index] {} resolved ticket(s) indexed", written);
    return written;
}

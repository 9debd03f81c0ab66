#pragma once
#include "ticket.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string getenv_or(const char* key, const std::string& def);
// Empty optional when the variable is unset; throws std::invalid_argument when it is not a number.
std::optional<long> getenv_long(const char* key);

std::string sha1_file(const std::filesystem::path& p);
std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts,
                                              const std::vector<std::string>& ignore_dirs);
std::string read_text_file(const std::filesystem::path& p);
std::vector<std::string> chunk_text_paragraphs(const std::string& text, int max_chars, int overlap);
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

std::string trim(const std::string& s);

// ISO-8601 UTC with second precision, e.g. 2025-12-30T09:00:00Z.
std::string format_time(TimePoint tp);
TimePoint parse_time(const std::string& text);
long long to_epoch_ms(TimePoint tp);

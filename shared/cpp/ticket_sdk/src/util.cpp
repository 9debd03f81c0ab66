#include "../include/util.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::optional<long> getenv_long(const char* key) {
    const char* v = std::getenv(key);
    if (!v || !*v) return std::nullopt;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (end == v || *end != '\0') {
        throw std::invalid_argument(std::string(key) + " is not an integer: " + v);
    }
    return n;
}

static std::string to_hex(const unsigned char* md, std::size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out += digits[md[i] >> 4];
        out += digits[md[i] & 0x0F];
    }
    return out;
}

std::string sha1_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open " + p.string());
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    unsigned char md[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), md);
    return to_hex(md, SHA_DIGEST_LENGTH);
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream in(p);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts,
                                              const std::vector<std::string>& ignore_dirs) {
    const std::unordered_set<std::string> wanted(exts.begin(), exts.end());
    const std::unordered_set<std::string> skipped(ignore_dirs.begin(), ignore_dirs.end());

    std::vector<std::filesystem::path> files;
    std::filesystem::recursive_directory_iterator it(root), end;
    for (; it != end; ++it) {
        if (it->is_directory() && skipped.count(it->path().filename().string())) {
            it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file()) continue;
        if (!wanted.empty() && !wanted.count(it->path().extension().string())) continue;
        files.push_back(it->path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<std::string> chunk_text_paragraphs(const std::string& text, int max_chars, int overlap) {
    const std::size_t limit = (std::size_t)std::max(1, max_chars);
    const std::size_t stride = (std::size_t)std::max(1, max_chars - overlap);
    std::vector<std::string> chunks;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) chunks.push_back(current);
        current.clear();
    };

    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t brk = text.find("\n\n", pos);
        if (brk == std::string::npos) brk = text.size();
        std::string para = text.substr(pos, brk - pos);
        pos = brk + 2;
        if (para.empty()) continue;

        if (para.size() > limit) {
            // Oversized paragraph: overlapping windows.
            flush();
            for (std::size_t off = 0; off < para.size(); off += stride) {
                chunks.push_back(para.substr(off, limit));
                if (off + limit >= para.size()) break;
            }
        } else if (current.empty()) {
            current = para;
        } else if (current.size() + 2 + para.size() <= limit) {
            current += "\n\n" + para;
        } else {
            flush();
            current = para;
        }
    }
    flush();
    return chunks;
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += (double)a[i] * (double)b[i];
        na += (double)a[i] * (double)a[i];
        nb += (double)b[i] * (double)b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot / (std::sqrt(na) * std::sqrt(nb)));
}

std::string trim(const std::string& s) {
    auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
    auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c){ return std::isspace(c); }).base();
    return b < e ? std::string(b, e) : std::string();
}

std::string format_time(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

TimePoint parse_time(const std::string& text) {
    std::tm tm{};
    std::istringstream is(text);
    is >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (is.fail()) throw std::invalid_argument("bad timestamp: " + text);
    return Clock::from_time_t(timegm(&tm));
}

long long to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

#include "utils.hpp"
#include <core/constants.hpp>
#include <openssl/evp.h>
#include <chrono>
#include <ctime>
#include <cctype>
#include <fstream>
#include <memory>

std::string file_timestamp(Timestamp t) {
    auto tt = std::chrono::system_clock::to_time_t(t);
    struct tm tm_buf;
    localtime_r(&tt, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

// ── Hashing ────────────────────────────────────────────────

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* digest, unsigned int len) {
    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += HEX[digest[i] >> 4];
        out += HEX[digest[i] & 0x0F];
    }
    return out;
}

} // namespace

std::string md5_hex(const std::string& data) {
    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx) return "";
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        return "";
    }
    return to_hex(digest, len);
}

std::string compute_file_md5(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return "";

    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) return "";

    char buf[FILE_CHUNK_SIZE];
    while (in) {
        in.read(buf, sizeof(buf));
        auto n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf, static_cast<size_t>(n)) != 1) {
            return "";
        }
    }
    if (in.bad()) return "";

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) return "";
    return to_hex(digest, len);
}

std::string parse_md5_from_output(const std::string& output) {
    size_t run = 0;
    for (size_t i = 0; i < output.size(); ++i) {
        if (std::isxdigit(static_cast<unsigned char>(output[i]))) {
            if (++run == 32) {
                // Reject runs longer than 32 (not an MD5)
                if (i + 1 < output.size() &&
                    std::isxdigit(static_cast<unsigned char>(output[i + 1]))) {
                    continue;
                }
                std::string hash = output.substr(i - 31, 32);
                for (auto& c : hash) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                return hash;
            }
        } else {
            run = 0;
        }
    }
    return "";
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        auto nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (nl == std::string::npos) {
            if (!line.empty()) lines.push_back(line);
            break;
        }
        lines.push_back(line);
        start = nl + 1;
    }
    return lines;
}

long long remaining_ms(Deadline deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? left : 0;
}

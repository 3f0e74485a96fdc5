#include "Utils.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#ifdef SECRET_HUNTER_HAVE_OPENSSL
#include <openssl/evp.h>
#endif

namespace secret_hunter {
namespace utils {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n\f\v");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out; std::string cur;
    for(char c : s) {
        if(c == ',') { cur = trim(cur); if(!cur.empty()) out.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    cur = trim(cur);
    if(!cur.empty()) out.push_back(cur);
    return out;
}

std::optional<std::vector<std::string>> read_list_file(const std::string& path) {
    std::ifstream in(path);
    if(!in) return std::nullopt;
    std::vector<std::string> out;
    std::string line;
    while(std::getline(in, line)) {
        line = trim(line);
        if(line.empty()) continue;
        if(line[0] == '#') continue;
        out.push_back(line);
    }
    return out;
}

// Length of the valid UTF-8 sequence starting at i, or 0 if invalid. On
// failure `bad` receives the number of bytes forming the maximal invalid subpart.
static size_t utf8_sequence_length(const std::string& s, size_t i, size_t& bad) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    bad = 1;
    if(c < 0x80) return 1;
    size_t need; unsigned char lo = 0x80, hi = 0xBF;
    if(c >= 0xC2 && c <= 0xDF) need = 1;
    else if(c == 0xE0) { need = 2; lo = 0xA0; }
    else if(c == 0xED) { need = 2; hi = 0x9F; }
    else if(c >= 0xE1 && c <= 0xEF) need = 2;
    else if(c == 0xF0) { need = 3; lo = 0x90; }
    else if(c >= 0xF1 && c <= 0xF3) need = 3;
    else if(c == 0xF4) { need = 3; hi = 0x8F; }
    else return 0;
    for(size_t k = 1; k <= need; ++k) {
        if(i + k >= s.size()) { bad = k; return 0; }
        const unsigned char cc = static_cast<unsigned char>(s[i + k]);
        const unsigned char l = (k == 1) ? lo : 0x80;
        const unsigned char h = (k == 1) ? hi : 0xBF;
        if(cc < l || cc > h) { bad = k; return 0; }
    }
    return need + 1;
}

void sanitize_utf8(std::string& s, DecodePolicy policy) {
    // fast path: pure ASCII or already valid
    size_t i = 0; size_t bad = 0;
    while(i < s.size()) {
        size_t n = utf8_sequence_length(s, i, bad);
        if(n == 0) break;
        i += n;
    }
    if(i == s.size()) return;

    std::string out;
    out.reserve(s.size() + 8);
    out.append(s, 0, i);
    while(i < s.size()) {
        size_t n = utf8_sequence_length(s, i, bad);
        if(n > 0) { out.append(s, i, n); i += n; continue; }
        if(policy == DecodePolicy::Replace) out.append("\xEF\xBF\xBD");
        i += bad;
    }
    s.swap(out);
}

bool have_sha256() {
#ifdef SECRET_HUNTER_HAVE_OPENSSL
    return true;
#else
    return false;
#endif
}

std::string sha256_file(const std::string& path) {
    std::string hexhash;
#ifdef SECRET_HUNTER_HAVE_OPENSSL
    FILE* fp = fopen(path.c_str(), "rb");
    if(!fp) return hexhash;
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdlen = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    bool ok = ctx && EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
    if(ok) {
        unsigned char buf[8192]; size_t got;
        while((got = fread(buf, 1, sizeof(buf), fp)) > 0) {
            if(EVP_DigestUpdate(ctx, buf, got) != 1) { ok = false; break; }
        }
        if(ferror(fp)) ok = false;
    }
    if(ok && EVP_DigestFinal_ex(ctx, md, &mdlen) == 1 && mdlen == 32) {
        static const char* hx = "0123456789abcdef";
        for(unsigned i = 0; i < mdlen; i++) { hexhash.push_back(hx[md[i] >> 4]); hexhash.push_back(hx[md[i] & 0xF]); }
    }
    if(ctx) EVP_MD_CTX_free(ctx);
    fclose(fp);
#else
    (void)path;
#endif
    return hexhash;
}

}
}

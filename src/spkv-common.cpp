#include "spkv-common.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>

int64_t now_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

int64_t steady_now_ms() {
    const auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

bool save_binary_file(const std::string & path, const std::string & data, std::string & err) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        err = "failed to open file for write: " + path;
        return false;
    }
    file.write(data.data(), (std::streamsize) data.size());
    if (!file.good()) {
        err = "failed to write file: " + path;
        return false;
    }
    return true;
}

bool load_binary_file(const std::string & path, std::vector<char> & out, std::string & err) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        err = "failed to open file for read: " + path;
        return false;
    }
    file.seekg(0, std::ios::end);
    const auto end_pos = file.tellg();
    if (end_pos < 0) {
        err = "failed to seek file: " + path;
        return false;
    }
    out.resize((size_t) end_pos);
    file.seekg(0, std::ios::beg);
    if (!out.empty()) {
        file.read(out.data(), (std::streamsize) out.size());
        if (!file.good()) {
            err = "failed to read file: " + path;
            return false;
        }
    }
    return true;
}

bool parse_i32(const char * s, int32_t & out) {
    if (s == nullptr || s[0] == '\0') {
        return false;
    }
    char * end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = (int32_t) v;
    return true;
}

bool parse_i64(const char * s, int64_t & out) {
    if (s == nullptr || s[0] == '\0') {
        return false;
    }
    char * end = nullptr;
    const long long v = std::strtoll(s, &end, 10);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = (int64_t) v;
    return true;
}

bool parse_f32(const char * s, float & out) {
    if (s == nullptr || s[0] == '\0') {
        return false;
    }
    char * end = nullptr;
    const float v = std::strtof(s, &end);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = v;
    return true;
}

bool parse_on_off_bool(const char * s, bool & out) {
    if (s == nullptr) {
        return false;
    }
    const std::string v = to_lower_ascii(s);
    if (v == "on" || v == "true" || v == "1" || v == "yes") {
        out = true;
        return true;
    }
    if (v == "off" || v == "false" || v == "0" || v == "no") {
        out = false;
        return true;
    }
    return false;
}

std::string trim_copy(const std::string & in) {
    size_t b = 0;
    while (b < in.size() && std::isspace((unsigned char) in[b])) {
        ++b;
    }
    size_t e = in.size();
    while (e > b && std::isspace((unsigned char) in[e - 1])) {
        --e;
    }
    return in.substr(b, e - b);
}

std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char) std::tolower(c); });
    return s;
}

bool parse_csv_list(const std::string & raw, std::vector<std::string> & out) {
    out.clear();
    size_t start = 0;
    while (start <= raw.size()) {
        const size_t comma = raw.find(',', start);
        const size_t end = comma == std::string::npos ? raw.size() : comma;
        const std::string token = trim_copy(raw.substr(start, end - start));
        if (!token.empty()) {
            out.push_back(token);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return !out.empty();
}

std::string file_extension_lower(const std::string & filename) {
    std::string ext = std::filesystem::path(filename).extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    return to_lower_ascii(ext);
}

int resolve_threads(int n_threads) {
    if (n_threads > 0) {
        return n_threads;
    }
    const unsigned hc = std::thread::hardware_concurrency();
    return (int) (hc > 0 ? hc : 1);
}

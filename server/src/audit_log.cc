#include "audit_log.h"
#include "dsauth_util.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

namespace dsauth {

static const char* level_name(int lvl) {
    switch (lvl) {
        case 0: return "DEBUG";
        case 1: return "INFO";
        case 2: return "ADMIN";
        case 3: return "SECURITY";
    }
    return "INFO";
}

AuditLog::AuditLog(std::string jsonl_path, std::string state_path)
    : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {}

bool AuditLog::set_min_level_str(const std::string& s) {
    const std::string u = lower_ascii(trim_ws(s));
    int lvl = -1;
    if (u == "debug")         lvl = 0;
    else if (u == "info")     lvl = 1;
    else if (u == "admin")    lvl = 2;
    else if (u == "security") lvl = 3;
    if (lvl < 0) return false;

    min_level_.store(lvl);
    return true;
}

std::string AuditLog::min_level_str() const {
    return level_name(min_level_.load());
}

std::string AuditLog::now_iso_utc() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << ms.count()
        << "Z";
    return oss.str();
}

std::string AuditLog::sha256_hex(const std::string& s) {
    unsigned char h[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);

    std::ostringstream oss;
    for (unsigned char b : h) oss << std::hex << std::setw(2) << std::setfill('0') << (int)b;
    return oss.str();
}

// Field order is part of the chain: ordered_json keeps insertion order, and
// the preimage is the line as it would look without line_hash.
std::string AuditLog::build_line(const AuditEvent& e,
                                 const std::string& prev_hash,
                                 std::string* out_line_hash) {
    nlohmann::ordered_json j;
    j["ts"] = e.ts_utc;
    j["event"] = e.event;
    j["outcome"] = e.outcome;
    j["level"] = level_name(static_cast<int>(e.level));
    j["prev_hash"] = prev_hash;
    if (!e.f.empty()) j["f"] = e.f;

    const std::string preimage = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const std::string line_hash = sha256_hex(prev_hash + preimage);
    if (out_line_hash) *out_line_hash = line_hash;

    nlohmann::ordered_json line;
    for (auto it = j.begin(); it != j.end(); ++it) {
        line[it.key()] = it.value();
        if (it.key() == "prev_hash") line["line_hash"] = line_hash;
    }
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string AuditLog::load_prev_hash_() const {
    std::ifstream f(state_path_);
    if (!f.good()) return std::string(64, '0');
    std::string line;
    std::getline(f, line);
    if (line.size() != 64) return std::string(64, '0');
    return line;
}

void AuditLog::store_prev_hash_(const std::string& h) const {
    std::ofstream f(state_path_, std::ios::trunc);
    f << h << "\n";
}

void AuditLog::append(const AuditEvent& e_in) {
    if (static_cast<int>(e_in.level) < min_level_.load()) return;

    std::lock_guard<std::mutex> lk(mu_);

    AuditEvent e = e_in;
    if (e.ts_utc.empty()) e.ts_utc = now_iso_utc();

    const std::string prev = load_prev_hash_();

    std::string line_hash;
    const std::string line = build_line(e, prev, &line_hash);

    std::ofstream out(jsonl_path_, std::ios::app);
    if (!out.good()) {
        std::cerr << "[audit] WARNING: cannot open " << jsonl_path_ << ", dropped " << e.event << std::endl;
        return;
    }
    out << line << "\n";
    out.flush();

    store_prev_hash_(line_hash);
}

} // namespace dsauth

#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace dsauth {

/*
AuditEvent
==========

One security-relevant event: root redemption, token issuance, logout.

Naming convention for `event`: "<subsystem>.<action>", e.g.
  - "auth.root_redeem"
  - "auth.token_created"
  - "auth.logout"

`outcome` is one of "ok", "fail", "deny".

NEVER put the root secret, API tokens, cookie values or signatures in `f`.
Log actor ids, reason codes and client addresses only.
*/
struct AuditEvent {
    enum class Level : int {
        DEBUG    = 0,
        INFO     = 1,
        ADMIN    = 2,
        SECURITY = 3,
    };

    std::string ts_utc;      // filled by append() if empty
    std::string event;
    std::string outcome;
    Level level = Level::INFO;
    std::map<std::string, std::string> f;
};

/*
AuditLog
========

Append-only JSONL file with a SHA-256 hash chain:

  line_hash_i = SHA256( line_hash_{i-1} || json_i_without_line_hash )

The last line_hash is kept in a small state file so appends do not rescan
the log. Removing, editing or reordering lines breaks the chain from that
point on. This is tamper evidence only; whoever can rewrite both files can
rewrite history.

append() is thread-safe; writers are serialized to keep the chain linear.
*/
class AuditLog {
public:
    AuditLog(std::string jsonl_path, std::string state_path);

    // Events below min_level are dropped without touching the files.
    void append(const AuditEvent& e);

    // Accepts DEBUG / INFO / ADMIN / SECURITY (case-insensitive).
    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;

    static std::string now_iso_utc();
    static std::string sha256_hex(const std::string& s);

    // Chain preimage/line builder, exposed for verification tooling and tests.
    static std::string build_line(const AuditEvent& e,
                                  const std::string& prev_hash,
                                  std::string* out_line_hash);

private:
    std::atomic<int> min_level_{static_cast<int>(AuditEvent::Level::INFO)};

    std::string jsonl_path_;
    std::string state_path_;
    std::mutex mu_;

    // 64 zeros when the state file is missing or unreadable (new chain).
    std::string load_prev_hash_() const;
    void store_prev_hash_(const std::string& h) const;
};

} // namespace dsauth

#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <mutex>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace erebus {

// Broker event log. Peer addresses never reach the output in clear text;
// they are replaced by a salted hash that changes every few hours.
class SecurityLogger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        AUTH_SUCCESS,
        AUTH_FAILURE,
        ACCESS_DENIED,
        INVALID_INPUT,
        CAPACITY_EXCEEDED,
        STORAGE_FAILURE,
        SHARD_FAILURE,
        CONNECTION_REJECTED,
        LIFECYCLE
    };

    /**
     * Writes one line: "[time UTC] [LEVEL] [EVENT] ip=<blinded> msg="<sanitized>"".
     * ERROR and CRITICAL go to stderr, the rest to stdout. DEBUG is dropped unless verbose.
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                    const std::string& message = "") {
        if (level == Level::DEBUG && !verbose()) return;

        std::stringstream ss;
        ss << "[" << utc_timestamp() << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "ip=" << blind_address(remote_addr);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        std::ostream& out = (level == Level::ERROR || level == Level::CRITICAL) ? std::cerr : std::cout;
        out << ss.str() << "\n";
    }

    // Shorthands for components that log without a remote peer.
    static void debug(EventType event, const std::string& message) {
        log(Level::DEBUG, event, "internal", message);
    }

    static void error(EventType event, const std::string& message) {
        log(Level::ERROR, event, "internal", message);
    }

    static void set_verbose(bool enabled) { verbose_flag().store(enabled); }
    static bool verbose() { return verbose_flag().load(); }

    // "anon_" + 12 hex chars of SHA-256(addr + salt). "unknown" and "internal" pass through.
    static std::string blind_address(const std::string& remote_addr) {
        if (remote_addr == "unknown" || remote_addr == "internal") return remote_addr;

        std::string data = remote_addr + current_salt();
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
        return "anon_" + to_hex(hash, 6);
    }

    // Quotes, backslashes and line breaks become spaces; other non-printables are dropped.
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static constexpr int SALT_ROTATION_HOURS = 6;

    static std::atomic<bool>& verbose_flag() {
        static std::atomic<bool> flag{false};
        return flag;
    }

    static std::string current_salt() {
        static std::mutex salt_mutex;
        static std::string salt;
        static std::chrono::steady_clock::time_point rotated_at;

        std::lock_guard<std::mutex> lock(salt_mutex);
        auto now = std::chrono::steady_clock::now();
        if (salt.empty() || now - rotated_at >= std::chrono::hours(SALT_ROTATION_HOURS)) {
            unsigned char b[32];
            if (RAND_bytes(b, sizeof(b)) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                std::terminate();
            }
            salt = to_hex(b, sizeof(b));
            rotated_at = now;
        }
        return salt;
    }

    static std::string to_hex(const unsigned char* data, size_t len) {
        std::stringstream hs;
        for (size_t i = 0; i < len; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
        return hs.str();
    }

    static std::string utc_timestamp() {
        auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        struct tm gmt;
        gmtime_r(&time_t, &gmt);
        std::stringstream ss;
        ss << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::AUTH_SUCCESS: return "AUTH_SUCCESS";
            case EventType::AUTH_FAILURE: return "AUTH_FAILURE";
            case EventType::ACCESS_DENIED: return "ACCESS_DENIED";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::CAPACITY_EXCEEDED: return "CAPACITY";
            case EventType::STORAGE_FAILURE: return "STORAGE";
            case EventType::SHARD_FAILURE: return "SHARD";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}

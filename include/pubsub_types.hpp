#pragma once

#include <string>
#include <optional>
#include <functional>
#include <stdexcept>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <boost/json.hpp>

namespace erebus {

constexpr size_t MAX_SUBSCRIBERS_PER_TOPIC = 5120;
constexpr size_t DEFAULT_MESSAGE_LIMIT = 100;
constexpr size_t STORAGE_LIST_LIMIT = 1000;
constexpr size_t PRUNE_PAGE_SIZE = 128;

// Cursor value meaning "nothing seen yet".
constexpr const char* NO_SEQUENCE = "0";
constexpr const char* WILDCARD_TOPIC = "*";

constexpr const char* CURIOSITY_PAYLOAD =
    R"({"type":"info","message":"Curious wanderer! Embark on your quest for knowledge at https://docs.erebus.sh/"})";

// Raised when a topic's subscriber list is full.
class CapacityError : public std::runtime_error {
public:
    explicit CapacityError(const std::string& what) : std::runtime_error(what) {}
};

// Application close codes sent on the WebSocket.
enum class WsCloseCode : uint16_t {
    BadRequest = 4400,
    Unauthorized = 4401,
    Forbidden = 4403,
    NotFound = 4404,
    InternalServerError = 4500
};

// Per-shard storage key layout.
namespace storage_keys {

inline std::string scope(const std::string& project_id, const std::string& channel, const std::string& topic) {
    return project_id + ":" + channel + ":" + topic;
}

inline std::string subscribers(const std::string& p, const std::string& c, const std::string& t) {
    return "subs:" + scope(p, c, t);
}

inline std::string subscribers_prefix(const std::string& p, const std::string& c) {
    return "subs:" + p + ":" + c + ":";
}

inline std::string sequence(const std::string& p, const std::string& c, const std::string& t) {
    return "seq:" + scope(p, c, t);
}

inline std::string message_prefix(const std::string& p, const std::string& c, const std::string& t) {
    return "msg:" + scope(p, c, t) + ":";
}

inline std::string message(const std::string& p, const std::string& c, const std::string& t, const std::string& seq) {
    return message_prefix(p, c, t) + seq;
}

inline std::string last_seen(const std::string& p, const std::string& c, const std::string& t,
                             const std::string& client_id) {
    return "last_seq_seen:" + scope(p, c, t) + ":" + client_id;
}

constexpr const char* SHARDS = "avalibleShards";
constexpr const char* LOCATION_HINT = "locationHint";

}

// A published message. Created once by the accepting shard and replicated verbatim.
struct MessageBody {
    std::string id;
    std::string topic;
    std::string sender_id;
    std::string seq;
    std::string sent_at;  // ISO-8601 UTC
    std::string payload;

    // Monotonic instrumentation timestamps (milliseconds).
    std::optional<double> t_ingress;
    std::optional<double> t_enqueued;
    std::optional<double> t_broadcast_begin;
    std::optional<double> t_ws_write_end;
    std::optional<double> t_broadcast_end;

    std::optional<std::string> client_msg_id;
    std::optional<double> client_publish_ts;

    boost::json::object to_json() const {
        boost::json::object obj;
        obj["id"] = id;
        obj["topic"] = topic;
        obj["senderId"] = sender_id;
        obj["seq"] = seq;
        obj["sentAt"] = sent_at;
        obj["payload"] = payload;
        if (t_ingress) obj["t_ingress"] = *t_ingress;
        if (t_enqueued) obj["t_enqueued"] = *t_enqueued;
        if (t_broadcast_begin) obj["t_broadcast_begin"] = *t_broadcast_begin;
        if (t_ws_write_end) obj["t_ws_write_end"] = *t_ws_write_end;
        if (t_broadcast_end) obj["t_broadcast_end"] = *t_broadcast_end;
        if (client_msg_id) obj["clientMsgId"] = *client_msg_id;
        if (client_publish_ts) obj["clientPublishTs"] = *client_publish_ts;
        return obj;
    }

    std::string serialize() const { return boost::json::serialize(to_json()); }

    static std::optional<MessageBody> from_json(const boost::json::value& v) {
        if (!v.is_object()) return std::nullopt;
        const auto& obj = v.as_object();

        auto str = [&](const char* key) -> std::optional<std::string> {
            auto* f = obj.if_contains(key);
            if (!f || !f->is_string()) return std::nullopt;
            return std::string(f->as_string());
        };
        auto num = [&](const char* key) -> std::optional<double> {
            auto* f = obj.if_contains(key);
            if (!f || !f->is_number()) return std::nullopt;
            return f->to_number<double>();
        };

        MessageBody m;
        auto id = str("id");
        auto topic = str("topic");
        auto sender = str("senderId");
        auto seq = str("seq");
        auto payload = str("payload");
        if (!id || !topic || !sender || !seq || !payload) return std::nullopt;

        m.id = *id;
        m.topic = *topic;
        m.sender_id = *sender;
        m.seq = *seq;
        m.payload = *payload;
        m.sent_at = str("sentAt").value_or("");
        m.t_ingress = num("t_ingress");
        m.t_enqueued = num("t_enqueued");
        m.t_broadcast_begin = num("t_broadcast_begin");
        m.t_ws_write_end = num("t_ws_write_end");
        m.t_broadcast_end = num("t_broadcast_end");
        m.client_msg_id = str("clientMsgId");
        m.client_publish_ts = num("clientPublishTs");
        return m;
    }
};

// Outcome counters of one local fan-out.
struct BroadcastMetrics {
    size_t sent = 0;
    size_t skipped = 0;
    size_t duplicates = 0;
    size_t errors = 0;
    size_t yields = 0;
    size_t high_backpressure = 0;
    double duration_ms = 0;
};

// Wall-clock milliseconds since the epoch. Injected so TTL logic can be tested.
using Clock = std::function<int64_t()>;

inline int64_t wall_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Monotonic milliseconds, used only for latency instrumentation.
inline double mono_now_ms() {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

// Maps a monotonic timestamp back onto the wall clock.
inline int64_t wall_from_mono_ms(double mono_ms) {
    return wall_now_ms() - static_cast<int64_t>(mono_now_ms() - mono_ms);
}

inline std::string iso8601_utc(int64_t epoch_ms) {
    std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    struct tm gmt;
    gmtime_r(&secs, &gmt);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &gmt);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(epoch_ms % 1000));
    return out;
}

}

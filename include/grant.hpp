#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <initializer_list>
#include <boost/json.hpp>

namespace erebus {

enum class TopicScope {
    Read,
    Write,
    ReadWrite,
    Huh  // decoy scope: receives an informational payload instead of messages
};

std::string scope_to_string(TopicScope scope);
std::optional<TopicScope> scope_from_string(const std::string& s);

struct TopicGrant {
    std::string topic;
    TopicScope scope;
};

// Capability token scoping a connection to one project/channel and its topics.
// Attached to the socket in serialized form for the connection's lifetime.
struct Grant {
    std::string project_id;
    std::optional<std::string> key_id;
    std::string channel;
    std::vector<TopicGrant> topics;
    std::string user_id;
    int64_t issued_at = 0;
    int64_t expires_at = 0;
    std::optional<std::string> webhook_url;

    // Scope of the entry covering topic. An exact entry wins over "*".
    std::optional<TopicScope> scope_for(const std::string& topic) const;

    // Access checks consider every entry matching topic exactly or through "*".
    bool has_topic_access(const std::string& topic) const { return scope_for(topic).has_value(); }
    bool can_read(const std::string& topic) const;
    bool can_write(const std::string& topic) const;
    bool is_curious(const std::string& topic) const;

    boost::json::object to_json() const;
    std::string serialize() const { return boost::json::serialize(to_json()); }

    // Schema validation of a grant claim set. Returns nullopt if any required field is missing or invalid.
    static std::optional<Grant> from_json(const boost::json::value& v);
    static std::optional<Grant> parse(const std::string& json);

private:
    bool any_entry(const std::string& topic, std::initializer_list<TopicScope> scopes) const;
};

// Verifies compact EdDSA JWS grant tokens against an Ed25519 JWK.
class GrantVerifier {
public:
    // An unusable key leaves the verifier unconfigured; every token then fails.
    explicit GrantVerifier(const std::string& public_key_jwk);

    bool is_configured() const { return public_key_.size() == 32; }

    /**
     * Checks signature, "alg", "exp" and "nbf", then schema-validates the payload.
     * @param now_sec Current UNIX time in seconds.
     */
    std::optional<Grant> verify(const std::string& token, int64_t now_sec) const;
    std::optional<Grant> verify(const std::string& token) const;

    // Extracts the raw 32-byte key from {"kty":"OKP","crv":"Ed25519","x":...}.
    static std::optional<std::vector<unsigned char>> parse_jwk(const std::string& jwk);

private:
    std::vector<unsigned char> public_key_;
};

}

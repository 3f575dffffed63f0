#include "grant.hpp"
#include "input_validator.hpp"
#include "security_logger.hpp"
#include "pubsub_types.hpp"
#include <chrono>

namespace erebus {

std::string scope_to_string(TopicScope scope) {
    switch (scope) {
        case TopicScope::Read: return "read";
        case TopicScope::Write: return "write";
        case TopicScope::ReadWrite: return "read-write";
        case TopicScope::Huh: return "huh?";
    }
    return "read";
}

std::optional<TopicScope> scope_from_string(const std::string& s) {
    if (s == "read") return TopicScope::Read;
    if (s == "write") return TopicScope::Write;
    if (s == "read-write") return TopicScope::ReadWrite;
    if (s == "huh?") return TopicScope::Huh;
    return std::nullopt;
}

std::optional<TopicScope> Grant::scope_for(const std::string& topic) const {
    std::optional<TopicScope> wildcard;
    for (const auto& t : topics) {
        if (t.topic == topic) return t.scope;
        if (!wildcard && t.topic == WILDCARD_TOPIC) wildcard = t.scope;
    }
    return wildcard;
}

bool Grant::any_entry(const std::string& topic, std::initializer_list<TopicScope> scopes) const {
    for (const auto& t : topics) {
        if (t.topic != topic && t.topic != WILDCARD_TOPIC) continue;
        for (auto s : scopes) {
            if (t.scope == s) return true;
        }
    }
    return false;
}

bool Grant::can_read(const std::string& topic) const {
    return any_entry(topic, {TopicScope::Read, TopicScope::ReadWrite});
}

bool Grant::can_write(const std::string& topic) const {
    return any_entry(topic, {TopicScope::Write, TopicScope::ReadWrite});
}

bool Grant::is_curious(const std::string& topic) const {
    return any_entry(topic, {TopicScope::Huh});
}

boost::json::object Grant::to_json() const {
    boost::json::object obj;
    obj["project_id"] = project_id;
    if (key_id) obj["key_id"] = *key_id;
    obj["channel"] = channel;

    boost::json::array arr;
    for (const auto& t : topics) {
        arr.push_back(boost::json::object{{"topic", t.topic}, {"scope", scope_to_string(t.scope)}});
    }
    obj["topics"] = std::move(arr);
    obj["userId"] = user_id;
    obj["issuedAt"] = issued_at;
    obj["expiresAt"] = expires_at;
    if (webhook_url) obj["webhook_url"] = *webhook_url;
    return obj;
}

std::optional<Grant> Grant::from_json(const boost::json::value& v) {
    if (!v.is_object()) return std::nullopt;
    const auto& obj = v.as_object();

    auto str = [&](const char* key) -> std::optional<std::string> {
        auto* f = obj.if_contains(key);
        if (!f || !f->is_string()) return std::nullopt;
        return std::string(f->as_string());
    };
    auto integer = [&](const char* key) -> std::optional<int64_t> {
        auto* f = obj.if_contains(key);
        if (!f || !f->is_number()) return std::nullopt;
        return static_cast<int64_t>(f->to_number<double>());
    };

    Grant g;
    auto project = str("project_id");
    auto channel = str("channel");
    auto user = str("userId");
    auto issued = integer("issuedAt");
    auto expires = integer("expiresAt");
    if (!project || !channel || !user || !issued || !expires) return std::nullopt;
    if (user->empty()) return std::nullopt;

    g.project_id = *project;
    g.channel = *channel;
    g.user_id = *user;
    g.issued_at = *issued;
    g.expires_at = *expires;
    g.key_id = str("key_id");
    g.webhook_url = str("webhook_url");

    auto* topics = obj.if_contains("topics");
    if (!topics || !topics->is_array()) return std::nullopt;
    for (const auto& item : topics->as_array()) {
        if (!item.is_object()) return std::nullopt;
        auto* topic = item.as_object().if_contains("topic");
        auto* scope = item.as_object().if_contains("scope");
        if (!topic || !topic->is_string() || !scope || !scope->is_string()) return std::nullopt;

        auto parsed = scope_from_string(std::string(scope->as_string()));
        if (!parsed) return std::nullopt;
        g.topics.push_back({std::string(topic->as_string()), *parsed});
    }
    return g;
}

std::optional<Grant> Grant::parse(const std::string& json) {
    try {
        return from_json(InputValidator::safe_parse_json(json));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

GrantVerifier::GrantVerifier(const std::string& public_key_jwk) {
    auto key = parse_jwk(public_key_jwk);
    if (key) {
        public_key_ = std::move(*key);
    } else if (!public_key_jwk.empty()) {
        SecurityLogger::error(SecurityLogger::EventType::AUTH_FAILURE, "Grant public key JWK is not a usable Ed25519 key");
    }
}

std::optional<std::vector<unsigned char>> GrantVerifier::parse_jwk(const std::string& jwk) {
    if (jwk.empty()) return std::nullopt;
    try {
        auto v = InputValidator::safe_parse_json(jwk);
        if (!v.is_object()) return std::nullopt;
        const auto& obj = v.as_object();

        auto* kty = obj.if_contains("kty");
        auto* crv = obj.if_contains("crv");
        auto* x = obj.if_contains("x");
        if (!kty || !kty->is_string() || kty->as_string() != "OKP") return std::nullopt;
        if (!crv || !crv->is_string() || crv->as_string() != "Ed25519") return std::nullopt;
        if (!x || !x->is_string()) return std::nullopt;

        auto raw = InputValidator::base64url_decode(std::string(x->as_string()));
        if (!raw || raw->size() != 32) return std::nullopt;
        return raw;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Grant> GrantVerifier::verify(const std::string& token) const {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return verify(token, now);
}

std::optional<Grant> GrantVerifier::verify(const std::string& token, int64_t now_sec) const {
    if (!is_configured()) return std::nullopt;

    auto first = token.find('.');
    if (first == std::string::npos) return std::nullopt;
    auto second = token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) return std::nullopt;

    std::string header_b64 = token.substr(0, first);
    std::string payload_b64 = token.substr(first + 1, second - first - 1);
    std::string sig_b64 = token.substr(second + 1);

    auto header_raw = InputValidator::base64url_decode(header_b64);
    auto payload_raw = InputValidator::base64url_decode(payload_b64);
    auto signature = InputValidator::base64url_decode(sig_b64);
    if (!header_raw || !payload_raw || !signature) return std::nullopt;

    try {
        auto header = InputValidator::safe_parse_json(std::string(header_raw->begin(), header_raw->end()));
        if (!header.is_object()) return std::nullopt;
        auto* alg = header.as_object().if_contains("alg");
        if (!alg || !alg->is_string() || alg->as_string() != "EdDSA") return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string signing_input = token.substr(0, second);
    std::vector<unsigned char> message(signing_input.begin(), signing_input.end());
    if (!InputValidator::verify_ed25519(public_key_, message, *signature)) {
        return std::nullopt;
    }

    boost::json::value claims;
    try {
        claims = InputValidator::safe_parse_json(std::string(payload_raw->begin(), payload_raw->end()));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (!claims.is_object()) return std::nullopt;

    const auto& obj = claims.as_object();
    if (auto* exp = obj.if_contains("exp"); exp && exp->is_number()) {
        if (static_cast<int64_t>(exp->to_number<double>()) <= now_sec) return std::nullopt;
    }
    if (auto* nbf = obj.if_contains("nbf"); nbf && nbf->is_number()) {
        if (static_cast<int64_t>(nbf->to_number<double>()) > now_sec) return std::nullopt;
    }

    return Grant::from_json(claims);
}

}

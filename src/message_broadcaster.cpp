#include "message_broadcaster.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>

namespace net = boost::asio;

namespace erebus {

MessageBroadcaster::MessageBroadcaster(net::any_io_executor executor, MessageBuffer& buffer, UsageSink& usage,
                                       ServerConfig::Broadcast config)
    : executor_(std::move(executor)), buffer_(buffer), usage_(usage), config_(config) {
    if (config_.batch_size == 0) config_.batch_size = 1;
    if (config_.presence_batch_size == 0) config_.presence_batch_size = 1;
}

void MessageBroadcaster::publish_message(PublishParams params, Sockets sockets, Completion done) {
    auto job = std::make_shared<FanoutJob>();
    job->started = mono_now_ms();
    job->params = std::move(params);
    job->sockets = std::move(sockets);
    job->subscribers.insert(job->params.subscriber_ids.begin(), job->params.subscriber_ids.end());
    job->serialized = job->params.message.serialize();
    job->batch_end = std::min(config_.batch_size, job->sockets.size());
    job->done = std::move(done);

    SecurityLogger::debug(SecurityLogger::EventType::LIFECYCLE,
                          "Fan-out topic=" + job->params.topic + " seq=" + job->params.seq +
                          " sockets=" + std::to_string(job->sockets.size()) +
                          " subscribers=" + std::to_string(job->subscribers.size()));
    run_batch(std::move(job));
}

void MessageBroadcaster::run_batch(std::shared_ptr<FanoutJob> job) {
    while (job->index < job->batch_end) {
        auto& socket = job->sockets[job->index];
        Outcome outcome;
        try {
            outcome = deliver(*job, *socket);
        } catch (const std::exception& e) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE,
                                socket->remote_address(), std::string("Send failed: ") + e.what());
            outcome = Outcome::Error;
        }

        if (outcome == Outcome::Yield) {
            net::post(executor_, [this, job]() { run_batch(job); });
            return;
        }

        switch (outcome) {
            case Outcome::Sent: job->metrics.sent++; break;
            case Outcome::Skipped: job->metrics.skipped++; break;
            case Outcome::HighBackpressure:
                job->metrics.skipped++;
                job->metrics.high_backpressure++;
                break;
            case Outcome::Duplicate: job->metrics.duplicates++; break;
            case Outcome::Error: job->metrics.errors++; break;
            case Outcome::Yield: break;
        }
        job->resume_send = false;
        job->index++;
    }

    if (job->index < job->sockets.size()) {
        job->batch_end = std::min(job->index + config_.batch_size, job->sockets.size());
        job->metrics.yields++;
        net::post(executor_, [this, job]() { run_batch(job); });
        return;
    }

    finish(std::move(job));
}

MessageBroadcaster::Outcome MessageBroadcaster::deliver(FanoutJob& job, ClientSocket& socket) {
    auto grant = attached_grant(socket);
    if (!grant) return Outcome::Skipped;

    const std::string& client_id = grant->user_id;
    const std::string& topic = job.params.topic;

    if (job.sent_to.count(client_id)) return Outcome::Duplicate;

    if (grant->is_curious(topic)) {
        if (!socket.is_open()) return Outcome::Skipped;
        socket.send_text(CURIOSITY_PAYLOAD);
        job.sent_to.insert(client_id);
        return Outcome::Sent;
    }

    if (!grant->can_read(topic)) return Outcome::Skipped;

    if (client_id == job.params.sender_id || !job.subscribers.count(client_id)) {
        return Outcome::Skipped;
    }
    if (!socket.is_open()) return Outcome::Skipped;

    if (!job.resume_send) {
        size_t buffered = socket.buffered_amount();
        if (buffered > config_.backpressure_high) {
            return Outcome::HighBackpressure;
        }
        if (buffered > config_.backpressure_low) {
            job.resume_send = true;
            return Outcome::Yield;
        }
    }

    socket.send_text(job.serialized);
    job.sent_to.insert(client_id);
    return Outcome::Sent;
}

void MessageBroadcaster::finish(std::shared_ptr<FanoutJob> job) {
    double t_end = mono_now_ms();
    job->params.message.t_ws_write_end = t_end;
    job->params.message.t_broadcast_end = t_end;
    job->metrics.duration_ms = t_end - job->started;

    auto& metrics = MetricsRegistry::instance();
    metrics.increment_counter("erebus_broadcast_sent_total", static_cast<double>(job->metrics.sent));
    metrics.increment_counter("erebus_broadcast_skipped_total", static_cast<double>(job->metrics.skipped));
    metrics.increment_counter("erebus_broadcast_duplicate_total", static_cast<double>(job->metrics.duplicates));
    metrics.increment_counter("erebus_broadcast_error_total", static_cast<double>(job->metrics.errors));
    metrics.increment_counter("erebus_broadcast_yield_total", static_cast<double>(job->metrics.yields));
    metrics.increment_counter("erebus_broadcast_high_backpressure_total",
                              static_cast<double>(job->metrics.high_backpressure));

    SecurityLogger::debug(SecurityLogger::EventType::LIFECYCLE,
                          "Fan-out done seq=" + job->params.seq +
                          " sent=" + std::to_string(job->metrics.sent) +
                          " skipped=" + std::to_string(job->metrics.skipped) +
                          " duplicates=" + std::to_string(job->metrics.duplicates) +
                          " errors=" + std::to_string(job->metrics.errors) +
                          " yields=" + std::to_string(job->metrics.yields));

    net::post(executor_, [this, job]() { run_background_tasks(job); });
}

void MessageBroadcaster::run_background_tasks(std::shared_ptr<FanoutJob> job) {
    const auto& p = job->params;

    try {
        buffer_.buffer_message(p.message, p.project_id, p.channel, p.topic, p.seq);
    } catch (const std::exception& e) {
        SecurityLogger::error(SecurityLogger::EventType::STORAGE_FAILURE,
                              "Buffering seq " + p.seq + " failed: " + e.what());
    }

    try {
        buffer_.update_last_seen_bulk(p.subscriber_ids, p.project_id, p.channel, p.topic, p.seq);
    } catch (const std::exception& e) {
        SecurityLogger::error(SecurityLogger::EventType::STORAGE_FAILURE,
                              "Last-seen update for seq " + p.seq + " failed: " + e.what());
    }

    usage_.enqueue(UsageEvent{"websocket.message", p.project_id, p.key_id, p.message.payload.size()});

    if (job->done) job->done(job->metrics);
}

void MessageBroadcaster::broadcast_presence(const boost::json::object& packet,
                                            const std::optional<std::string>& self_client_id,
                                            const std::vector<std::string>& subscribers, Sockets sockets) {
    auto job = std::make_shared<PresenceJob>();
    job->generic = boost::json::serialize(packet);

    boost::json::object enriched = packet;
    boost::json::array list;
    for (const auto& s : subscribers) list.emplace_back(s);
    enriched["subscribers"] = std::move(list);
    job->self_variant = boost::json::serialize(enriched);

    job->members.insert(subscribers.begin(), subscribers.end());
    job->self_client_id = self_client_id;
    job->sockets = std::move(sockets);
    run_presence_batch(std::move(job));
}

void MessageBroadcaster::run_presence_batch(std::shared_ptr<PresenceJob> job) {
    size_t end = std::min(job->index + config_.presence_batch_size, job->sockets.size());
    while (job->index < end) {
        auto& socket = job->sockets[job->index];
        try {
            std::optional<Grant> grant;
            if (socket->is_open()) grant = attached_grant(*socket);
            bool member = grant && (job->members.empty() || job->members.count(grant->user_id));

            if (member && !job->resume_send) {
                size_t buffered = socket->buffered_amount();
                if (buffered > config_.backpressure_high) {
                    member = false;
                } else if (buffered > config_.backpressure_low) {
                    job->resume_send = true;
                    net::post(executor_, [this, job]() { run_presence_batch(job); });
                    return;
                }
            }

            if (member) {
                bool is_self = job->self_client_id && grant->user_id == *job->self_client_id;
                socket->send_text(is_self ? job->self_variant : job->generic);
            }
        } catch (const std::exception& e) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE,
                                socket->remote_address(), std::string("Presence send failed: ") + e.what());
        }
        job->resume_send = false;
        job->index++;
    }

    if (job->index < job->sockets.size()) {
        net::post(executor_, [this, job]() { run_presence_batch(job); });
    }
}

}

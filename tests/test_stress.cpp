#include <gtest/gtest.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>
#include "actor_registry.hpp"
#include "memory_storage.hpp"
#include "test_support.hpp"

using namespace erebus;
using namespace erebus::testing;

TEST(StressTest, ConcurrentPublishersOneShard) {
    boost::asio::io_context ioc;
    GrantIssuer issuer;
    GrantVerifier verifier{issuer.jwk()};
    ServerConfig config;
    config.location_hint = "eu";
    RecordingUsage usage;
    auto storage = std::make_shared<MemoryStorage>();

    ActorRegistry registry(ioc.get_executor(), config, verifier, usage,
                           [storage](const std::string&) -> std::shared_ptr<ChannelStorage> { return storage; });
    auto actor = registry.get_or_create("proj:chat:channel:v1:eu");

    const int num_subscribers = 32;
    const int num_publishers = 4;
    const int msgs_per_publisher = 50;

    std::vector<std::shared_ptr<FakeSocket>> subscribers;
    for (int i = 0; i < num_subscribers; ++i) {
        auto s = std::make_shared<FakeSocket>();
        actor->attach(s, "eu");
        actor->on_message(s, connect_packet(issuer.token(make_grant("sub" + std::to_string(i),
                                                                    {{"room", TopicScope::Read}}))));
        actor->on_message(s, subscribe_packet("room"));
        subscribers.push_back(s);
    }

    std::vector<std::shared_ptr<FakeSocket>> publishers;
    for (int i = 0; i < num_publishers; ++i) {
        auto s = std::make_shared<FakeSocket>();
        actor->attach(s, "eu");
        actor->on_message(s, connect_packet(issuer.token(make_grant("pub" + std::to_string(i),
                                                                    {{"room", TopicScope::Write}}))));
        actor->on_message(s, subscribe_packet("room"));
        publishers.push_back(s);
    }
    ioc.run();
    ioc.restart();

    // Publishers post from their own threads while the pool drains the strand.
    auto work = boost::asio::make_work_guard(ioc);
    std::vector<std::thread> pool;
    for (int i = 0; i < 4; ++i) pool.emplace_back([&ioc] { ioc.run(); });

    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> senders;
    for (int p = 0; p < num_publishers; ++p) {
        senders.emplace_back([&, p] {
            for (int m = 0; m < msgs_per_publisher; ++m) {
                actor->on_message(publishers[p], publish_packet("room", "p" + std::to_string(p) + "m" + std::to_string(m),
                                                                true, "cm" + std::to_string(m)));
            }
        });
    }
    for (auto& t : senders) t.join();

    const size_t expected = static_cast<size_t>(num_publishers) * msgs_per_publisher;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (subscribers.back()->messages().size() < expected && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    work.reset();
    for (auto& t : pool) t.join();

    std::chrono::duration<double> diff = std::chrono::steady_clock::now() - start;
    std::cout << "[*] Delivered " << expected * num_subscribers << " messages in " << diff.count() << "s" << std::endl;

    for (const auto& s : subscribers) {
        auto msgs = s->messages();
        ASSERT_EQ(msgs.size(), expected);
        std::set<std::string> seqs;
        for (const auto& m : msgs) seqs.insert(std::string(m.at("seq").as_string()));
        EXPECT_EQ(seqs.size(), expected);
    }
    for (const auto& p : publishers) {
        size_t publish_acks = 0;
        for (const auto& ack : p->packets("ack")) {
            if (ack.at("type").as_object().at("path").as_string() == "publish") publish_acks++;
        }
        EXPECT_EQ(publish_acks, static_cast<size_t>(msgs_per_publisher));
    }
    EXPECT_EQ(usage.count("websocket.message"), expected);
}

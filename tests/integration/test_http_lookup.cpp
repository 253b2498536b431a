/**
 * @file test_http_lookup.cpp
 * @brief Integration test: HttpLookupClient against an in-process HTTP responder
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nsqsub/core/event_loop.hpp>
#include <nsqsub/core/reader.hpp>
#include <nsqsub/lookup/http_lookup_client.hpp>
#include <nsqsub/utils/logger.hpp>

#include "support/fake_connection.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace nsqsub;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using namespace std::chrono_literals;

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

const char* kOrdersBody =
    R"({"channels":["billing"],"producers":[)"
    R"({"hostname":"nsqd-1","broadcast_address":"127.0.0.1","tcp_port":4150,"http_port":4151}]})";

const char* kOrdersEnvelope =
    R"({"status_code":200,"status_txt":"OK","data":{"channels":[],"producers":[)"
    R"({"broadcast_address":"127.0.0.2","tcp_port":4250}]}})";

/**
 * @brief Blocking HTTP responder that answers a fixed number of requests.
 */
class FakeLookupd {
public:
    struct Reply {
        http::status status = http::status::ok;
        std::string body;
    };

    FakeLookupd()
        : acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {}

    ~FakeLookupd() {
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    /// Answer the next replies.size() connections in order on a worker thread.
    void serve(std::vector<Reply> replies) {
        worker_ = std::thread([this, replies]() {
            for (const auto& reply : replies) {
                tcp::socket socket(io_);
                acceptor_.accept(socket);

                boost::beast::flat_buffer buffer;
                http::request<http::string_body> request;
                http::read(socket, buffer, request);
                {
                    auto target = request.target();
                    std::lock_guard<std::mutex> lock(mutex_);
                    targets_.emplace_back(target.data(), target.size());
                }

                http::response<http::string_body> response{reply.status, request.version()};
                response.set(http::field::content_type, "application/json");
                response.body() = reply.body;
                response.prepare_payload();
                http::write(socket, response);

                boost::beast::error_code ignored;
                socket.shutdown(tcp::socket::shutdown_both, ignored);
            }
        });
    }

    std::vector<std::string> targets() {
        std::lock_guard<std::mutex> lock(mutex_);
        return targets_;
    }

private:
    boost::asio::io_context io_;
    tcp::acceptor acceptor_;
    std::thread worker_;
    std::mutex mutex_;
    std::vector<std::string> targets_;
};

struct LookupResult {
    bool success = false;
    std::vector<core::LookupNode> nodes;
};

LookupResult lookupAndWait(lookup::HttpLookupClient& client, const std::string& endpoint,
                           const std::string& topic) {
    auto promise = std::make_shared<std::promise<LookupResult>>();
    auto future = promise->get_future();
    client.lookup(endpoint, topic,
        [promise](bool success, const std::vector<core::LookupNode>& nodes) {
            promise->set_value(LookupResult{success, nodes});
        });
    EXPECT_EQ(future.wait_for(10s), std::future_status::ready);
    return future.get();
}

}  // namespace

class HttpLookupTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::DEBUG);
    }

    void TearDown() override {
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    std::string endpoint() const {
        return "http://127.0.0.1:" + std::to_string(lookupd_.port());
    }

    FakeLookupd lookupd_;
};

// =============================================================================
// HttpLookupClient
// =============================================================================

TEST_F(HttpLookupTest, LookupDecodesProducers) {
    lookupd_.serve({{http::status::ok, kOrdersBody}});
    lookup::HttpLookupClient client;

    auto result = lookupAndWait(client, endpoint(), "orders");

    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.nodes.size(), 1u);
    EXPECT_EQ(result.nodes[0].broadcast_address, "127.0.0.1");
    EXPECT_EQ(result.nodes[0].tcp_port, 4150);
    EXPECT_THAT(lookupd_.targets(), ElementsAre("/lookup?topic=orders"));
}

TEST_F(HttpLookupTest, LegacyEnvelopeDecoded) {
    lookupd_.serve({{http::status::ok, kOrdersEnvelope}});
    lookup::HttpLookupClient client;

    auto result = lookupAndWait(client, endpoint() + "/nsq/", "orders");

    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.nodes.size(), 1u);
    EXPECT_EQ(result.nodes[0].broadcast_address, "127.0.0.2");
    EXPECT_EQ(result.nodes[0].tcp_port, 4250);
    EXPECT_THAT(lookupd_.targets(), ElementsAre("/nsq/lookup?topic=orders"));
}

TEST_F(HttpLookupTest, NotFoundStatusFails) {
    lookupd_.serve({{http::status::not_found, R"({"message":"TOPIC_NOT_FOUND"})"}});
    lookup::HttpLookupClient client;

    auto result = lookupAndWait(client, endpoint(), "payments");

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.nodes, IsEmpty());
}

TEST_F(HttpLookupTest, UndecodableBodyFails) {
    lookupd_.serve({{http::status::ok, "<html>gateway</html>"}});
    lookup::HttpLookupClient client;

    auto result = lookupAndWait(client, endpoint(), "orders");

    EXPECT_FALSE(result.success);
}

TEST_F(HttpLookupTest, SilentServerTimesOut) {
    // Listening but never accepting: the connect completes, the response never arrives
    lookup::HttpLookupConfig config;
    config.timeout = 300ms;
    lookup::HttpLookupClient client(config);

    auto started = std::chrono::steady_clock::now();
    auto result = lookupAndWait(client, endpoint(), "orders");

    EXPECT_FALSE(result.success);
    EXPECT_GE(std::chrono::steady_clock::now() - started, 250ms);
}

TEST_F(HttpLookupTest, UnsupportedSchemeFailsImmediately) {
    lookup::HttpLookupClient client;

    auto result = lookupAndWait(client, "https://127.0.0.1:4161", "orders");

    EXPECT_FALSE(result.success);
    EXPECT_THAT(lookupd_.targets(), IsEmpty());
}

// =============================================================================
// Reader over a live HTTP lookup service
// =============================================================================

TEST_F(HttpLookupTest, ReaderConnectsToDiscoveredBroker) {
    lookupd_.serve({{http::status::ok, kOrdersBody}});

    core::EventLoop loop;
    ASSERT_TRUE(loop.start());

    test::FakeConnectionFactory connections;
    connections.connectImmediately = true;

    core::ReaderOptions options;
    options.discovery_addresses = endpoint();
    options.discovery_poll_interval = 60;
    options.discovery_poll_jitter = 0;

    core::ReaderCollaborators collaborators;
    collaborators.connection_factory = connections.factory();
    collaborators.lookup_client = std::make_shared<lookup::HttpLookupClient>();

    auto reader = std::make_unique<core::Reader>("orders", "billing", options, loop,
                                                 std::move(collaborators));

    auto connected = std::make_shared<std::promise<std::string>>();
    reader->events().nsqdConnected.connect(
        [connected](const std::string& host, uint16_t port) {
            connected->set_value(core::connectionId(host, port));
        });

    loop.post([&reader]() { reader->connect(); });

    auto future = connected->get_future();
    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(future.get(), "127.0.0.1:4150");

    std::promise<void> closed;
    auto closedFuture = closed.get_future();
    loop.post([&reader, &closed]() {
        reader->close();
        closed.set_value();
    });
    ASSERT_EQ(closedFuture.wait_for(5s), std::future_status::ready);

    loop.stop();
    reader.reset();
    EXPECT_THAT(lookupd_.targets(), ElementsAre("/lookup?topic=orders"));
}

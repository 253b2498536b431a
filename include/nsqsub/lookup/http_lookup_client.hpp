/**
 * @file http_lookup_client.hpp
 * @brief LookupClient for the discovery service's HTTP interface.
 *
 * HttpLookupClient issues `GET <base>/lookup?topic=<topic>` against a
 * discovery endpoint and decodes the JSON body with decodeLookupResponse().
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/lookup_client.hpp"
#include "nsqsub/lookup/export.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

namespace nsqsub {
namespace lookup {

/**
 * @struct HttpEndpoint
 * @brief Parsed discovery endpoint.
 */
struct NSQSUB_LOOKUP_API HttpEndpoint {
    std::string host;
    std::string port = "80";
    std::string basePath;       ///< Without trailing '/', may be empty
};

struct NSQSUB_LOOKUP_API HttpLookupConfig {
    std::chrono::milliseconds timeout{5000};    ///< Resolve + connect + exchange
    std::string user_agent = "nsqsub";
};

/**
 * @class HttpLookupClient
 * @brief LookupClient over plain HTTP, driven by its own I/O thread.
 *
 * Callbacks run on the I/O thread. Requests still pending when the client
 * is destroyed are abandoned without invoking their callbacks.
 *
 * Usage:
 * @code
 * auto client = std::make_shared<HttpLookupClient>();
 * client->lookup("http://10.0.0.2:4161", "orders",
 *     [](bool ok, const std::vector<core::LookupNode>& nodes) { ... });
 * @endcode
 */
class NSQSUB_LOOKUP_API HttpLookupClient : public core::LookupClient {
public:
    explicit HttpLookupClient(HttpLookupConfig config = HttpLookupConfig());

    ~HttpLookupClient() override;

    HttpLookupClient(const HttpLookupClient&) = delete;
    HttpLookupClient& operator=(const HttpLookupClient&) = delete;

    void lookup(const std::string& endpoint, const std::string& topic,
                Callback callback) override;

    /**
     * @brief Parse "host:port", "http://host[:port][/base]".
     * @return nullopt for other schemes or an empty host.
     */
    static std::optional<HttpEndpoint> parseEndpoint(const std::string& endpoint);

    /**
     * @brief Request target for a topic, e.g. "/lookup?topic=orders".
     */
    static std::string lookupTarget(const HttpEndpoint& endpoint, const std::string& topic);

private:
    HttpLookupConfig config_;
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread worker_;
};

}  // namespace lookup
}  // namespace nsqsub

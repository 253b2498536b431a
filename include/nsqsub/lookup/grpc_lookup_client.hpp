/**
 * @file grpc_lookup_client.hpp
 * @brief Async gRPC client for the discovery service.
 *
 * GrpcLookupClient manages gRPC channels and stubs for calling
 * LookupService on discovery endpoints.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/lookup_client.hpp"
#include "nsqsub/lookup/export.hpp"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace nsqsub {
namespace lookup {

/**
 * @struct GrpcLookupConfig
 * @brief Settings for GrpcLookupClient.
 */
struct NSQSUB_LOOKUP_API GrpcLookupConfig {
    std::chrono::milliseconds timeout{5000};    ///< Per-call deadline
    int keepalive_time_ms = 10000;
    int keepalive_timeout_ms = 5000;
};

/**
 * @class GrpcLookupClient
 * @brief LookupClient speaking the LookupService RPC.
 *
 * Creates and caches one channel/stub per endpoint. Callbacks run on a
 * gRPC thread.
 *
 * Usage:
 * @code
 * auto client = std::make_shared<GrpcLookupClient>();
 * client->lookup("http://10.0.0.2:4161", "orders",
 *     [](bool ok, const std::vector<core::LookupNode>& nodes) {
 *         if (ok) { ... }
 *     });
 * @endcode
 */
class NSQSUB_LOOKUP_API GrpcLookupClient : public core::LookupClient {
public:
    explicit GrpcLookupClient(GrpcLookupConfig config = GrpcLookupConfig());

    ~GrpcLookupClient() override;

    GrpcLookupClient(const GrpcLookupClient&) = delete;
    GrpcLookupClient& operator=(const GrpcLookupClient&) = delete;

    void lookup(const std::string& endpoint, const std::string& topic,
                Callback callback) override;

    /**
     * @brief Strip a URL scheme and path: "http://host:4161/x" -> "host:4161".
     */
    static std::string channelTarget(const std::string& endpoint);

    /**
     * @brief Remove cached channel for an endpoint.
     */
    void removeChannel(const std::string& endpoint);

    void clearChannels();

    size_t channelCount() const;

private:
    struct ChannelEntry;

    GrpcLookupConfig config_;

    mutable std::mutex channelMutex_;
    std::unordered_map<std::string, std::shared_ptr<ChannelEntry>> channels_;

    // Get or create channel/stub for a target
    std::shared_ptr<ChannelEntry> getChannel(const std::string& target);
};

}  // namespace lookup
}  // namespace nsqsub

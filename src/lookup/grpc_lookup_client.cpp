/**
 * @file grpc_lookup_client.cpp
 * @brief GrpcLookupClient implementation.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/lookup/grpc_lookup_client.hpp"
#include "nsqsub/lookup/lookup_codec.hpp"
#include "nsqsub/utils/logger.hpp"

#include "nsqsub/proto/lookup.grpc.pb.h"

namespace nsqsub {
namespace lookup {

struct GrpcLookupClient::ChannelEntry {
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<lookupd::LookupService::Stub> stub;
};

namespace {

// State that must outlive an async call
struct LookupCall {
    grpc::ClientContext context;
    lookupd::LookupRequest request;
    lookupd::LookupResponse response;
    // Keeps the stub alive if the channel is evicted mid-call
    std::shared_ptr<void> channelRef;
};

}  // namespace

GrpcLookupClient::GrpcLookupClient(GrpcLookupConfig config)
    : config_(config)
{
    LOG_DEBUG("LookupClient", "Created gRPC lookup client (timeout {}ms)",
              config_.timeout.count());
}

GrpcLookupClient::~GrpcLookupClient() {
    clearChannels();
}

std::string GrpcLookupClient::channelTarget(const std::string& endpoint) {
    std::string target = endpoint;

    auto scheme = target.find("://");
    if (scheme != std::string::npos) {
        target = target.substr(scheme + 3);
    }
    auto path = target.find('/');
    if (path != std::string::npos) {
        target = target.substr(0, path);
    }
    return target;
}

std::shared_ptr<GrpcLookupClient::ChannelEntry>
GrpcLookupClient::getChannel(const std::string& target) {
    std::lock_guard<std::mutex> lock(channelMutex_);

    auto it = channels_.find(target);
    if (it != channels_.end()) {
        return it->second;
    }

    LOG_DEBUG("LookupClient", "Creating channel to {}", target);

    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, config_.keepalive_time_ms);
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, config_.keepalive_timeout_ms);
    args.SetInt(GRPC_ARG_HTTP2_MAX_PINGS_WITHOUT_DATA, 0);

    auto entry = std::make_shared<ChannelEntry>();
    entry->channel = grpc::CreateCustomChannel(
        target,
        grpc::InsecureChannelCredentials(),
        args);
    entry->stub = lookupd::LookupService::NewStub(entry->channel);

    channels_[target] = entry;
    return entry;
}

void GrpcLookupClient::lookup(const std::string& endpoint, const std::string& topic,
                              Callback callback) {
    std::string target = channelTarget(endpoint);
    if (target.empty()) {
        LOG_WARN("LookupClient", "Invalid lookup endpoint '{}'", endpoint);
        callback(false, {});
        return;
    }

    auto entry = getChannel(target);

    auto call = std::make_shared<LookupCall>();
    call->context.set_deadline(std::chrono::system_clock::now() + config_.timeout);
    call->request.set_topic(topic);
    call->channelRef = entry;

    entry->stub->async()->Lookup(
        &call->context,
        &call->request,
        &call->response,
        [call, callback, target, topic](grpc::Status status) {
            if (!status.ok()) {
                LOG_WARN("LookupClient", "Lookup of '{}' on {} failed: {}",
                         topic, target, status.error_message());
                callback(false, {});
                return;
            }
            auto nodes = toLookupNodes(call->response);
            LOG_TRACE("LookupClient", "{} has {} producer(s) for '{}'",
                      target, nodes.size(), topic);
            callback(true, nodes);
        });
}

void GrpcLookupClient::removeChannel(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(channelMutex_);
    auto it = channels_.find(channelTarget(endpoint));
    if (it != channels_.end()) {
        LOG_DEBUG("LookupClient", "Removing channel to {}", it->first);
        channels_.erase(it);
    }
}

void GrpcLookupClient::clearChannels() {
    std::lock_guard<std::mutex> lock(channelMutex_);
    LOG_DEBUG("LookupClient", "Clearing all channels");
    channels_.clear();
}

size_t GrpcLookupClient::channelCount() const {
    std::lock_guard<std::mutex> lock(channelMutex_);
    return channels_.size();
}

}  // namespace lookup
}  // namespace nsqsub

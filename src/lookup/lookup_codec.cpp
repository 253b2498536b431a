/**
 * @file lookup_codec.cpp
 * @brief Discovery response decoding via the protobuf JSON mapping.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/lookup/lookup_codec.hpp"
#include "nsqsub/utils/logger.hpp"

#include "nsqsub/proto/lookup.pb.h"

#include <google/protobuf/util/json_util.h>

namespace nsqsub {
namespace lookup {

namespace {

constexpr int kStatusOk = 200;

google::protobuf::util::JsonParseOptions parseOptions() {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    return options;
}

}  // namespace

std::vector<core::LookupNode> toLookupNodes(const lookupd::LookupResponse& response) {
    std::vector<core::LookupNode> nodes;
    nodes.reserve(static_cast<size_t>(response.producers_size()));

    for (const auto& producer : response.producers()) {
        if (producer.broadcast_address().empty() ||
            producer.tcp_port() <= 0 || producer.tcp_port() > 65535) {
            LOG_WARN("LookupCodec", "Skipping producer '{}' with port {}",
                     producer.broadcast_address(), producer.tcp_port());
            continue;
        }
        core::LookupNode node;
        node.broadcast_address = producer.broadcast_address();
        node.tcp_port = static_cast<uint16_t>(producer.tcp_port());
        nodes.push_back(std::move(node));
    }
    return nodes;
}

std::optional<std::vector<core::LookupNode>> decodeLookupResponse(const std::string& json) {
    auto options = parseOptions();

    // Legacy envelope first: a bare body parses as an envelope without data
    lookupd::LegacyLookupEnvelope envelope;
    auto status = google::protobuf::util::JsonStringToMessage(json, &envelope, options);
    if (!status.ok()) {
        LOG_WARN("LookupCodec", "Malformed lookup response: {}", status.ToString());
        return std::nullopt;
    }
    if (envelope.has_data()) {
        if (envelope.status_code() != 0 && envelope.status_code() != kStatusOk) {
            LOG_WARN("LookupCodec", "Lookup returned status {} ({})",
                     envelope.status_code(), envelope.status_txt());
            return std::nullopt;
        }
        return toLookupNodes(envelope.data());
    }
    if (envelope.status_code() != 0 && envelope.status_code() != kStatusOk) {
        LOG_WARN("LookupCodec", "Lookup returned status {} ({})",
                 envelope.status_code(), envelope.status_txt());
        return std::nullopt;
    }

    lookupd::LookupResponse response;
    status = google::protobuf::util::JsonStringToMessage(json, &response, options);
    if (!status.ok()) {
        LOG_WARN("LookupCodec", "Malformed lookup response: {}", status.ToString());
        return std::nullopt;
    }
    return toLookupNodes(response);
}

}  // namespace lookup
}  // namespace nsqsub

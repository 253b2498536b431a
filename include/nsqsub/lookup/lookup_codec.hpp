/**
 * @file lookup_codec.hpp
 * @brief Decoding of discovery service responses.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/lookup_client.hpp"
#include "nsqsub/lookup/export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nsqsub {

// Forward declaration for the generated protobuf type
namespace lookupd {
class LookupResponse;
}

namespace lookup {

/**
 * @brief Decode a discovery service JSON body.
 *
 * Accepts `{"channels":[...],"producers":[...]}` and the legacy
 * `{"status_code":200,"status_txt":"OK","data":{...}}` envelope. Unknown
 * fields are ignored. Producers without an address or with a port outside
 * 1..65535 are skipped.
 * @return Nodes in response order, or nullopt if the body is not valid JSON
 *         for either shape or the envelope reports a non-200 status.
 */
NSQSUB_LOOKUP_API std::optional<std::vector<core::LookupNode>>
decodeLookupResponse(const std::string& json);

/**
 * @brief Convert a decoded response into lookup nodes (same filtering).
 */
NSQSUB_LOOKUP_API std::vector<core::LookupNode> toLookupNodes(const lookupd::LookupResponse& response);

}  // namespace lookup
}  // namespace nsqsub

#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by the transport contract and the connection supervisor.
//
// For the transport contract, use: #include "wsgate/transport/transport_connection.hpp"
// For the reconnect state machine, use: #include "wsgate/transport/connection_supervisor.hpp"

#include <nlohmann/json.hpp>
#include <string>

#include <tl/expected.hpp>

namespace wsgate {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category { Network, Closed };

    Category category{};
    std::string message;

    static TransportError closed() {
        return {Category::Closed, "Transport is not open"};
    }
};

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace wsgate

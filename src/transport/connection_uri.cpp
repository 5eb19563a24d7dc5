#include "wsgate/transport/connection_uri.hpp"

#include <ada.h>

namespace wsgate {

namespace {

// Sent only while the gateway may still create the session
bool is_creation_only(std::string_view key) noexcept {
    return (key == "expires") || (key == "timeout");
}

}  // namespace

std::optional<ConnectionUri> ConnectionUri::parse(std::string_view uri) {
    auto parsed = ada::parse<ada::url>(uri);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }
    auto& url = parsed.value();

    // ada reports the scheme with its trailing colon
    const std::string_view protocol = url.get_protocol();
    const bool is_ws = (protocol == "ws:");
    const bool is_wss = (protocol == "wss:");
    if ((is_ws || is_wss) == false) {
        return std::nullopt;
    }
    if (url.get_hostname().empty()) {
        return std::nullopt;
    }

    ConnectionUri result;

    const std::string search(url.get_search());
    if (search.empty() == false) {
        ada::url_search_params query(search);
        auto entries = query.get_entries();
        while (entries.has_next()) {
            const auto entry = entries.next();
            if (entry.has_value() == false) {
                break;
            }
            const auto& [key, value] = *entry;
            if (key == "sid") {
                if (value.empty() == false) {
                    result.session_id_ = std::string(value);
                }
                continue;
            }
            result.params_.emplace_back(std::string(key), std::string(value));
        }
    }

    url.set_search("");
    url.set_hash("");
    result.base_ = std::string(url.get_href());
    return result;
}

std::string ConnectionUri::build(const std::optional<std::string>& session_id, bool ever_ready) const {
    ada::url_search_params query;
    if (session_id.has_value() && (session_id->empty() == false)) {
        query.append("sid", *session_id);
    }
    for (const auto& [key, value] : params_) {
        if (ever_ready && is_creation_only(key)) {
            continue;
        }
        query.append(key, value);
    }

    if (query.size() == 0) {
        return base_;
    }
    return base_ + "?" + query.to_string();
}

}  // namespace wsgate

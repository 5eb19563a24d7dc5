#include "wsgate/protocol/frames.hpp"

namespace wsgate {

namespace {

FrameError from_simdjson(simdjson::error_code error) {
    return FrameError::invalid_json(std::string(simdjson::error_message(error)));
}

// Correlation ids are non-negative integers. The decoder yields signed
// integers for anything that fits in int64.
std::optional<CorrelationId> as_correlation_id(const Json& value) {
    if (value.is_number_unsigned()) {
        return value.get<CorrelationId>();
    }
    if (value.is_number_integer()) {
        const auto signed_id = value.get<std::int64_t>();
        if (signed_id < 0) {
            return std::nullopt;
        }
        return static_cast<CorrelationId>(signed_id);
    }
    return std::nullopt;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CommandFrame
// ─────────────────────────────────────────────────────────────────────────────

Json CommandFrame::to_json() const {
    Json frame = {{"m", method}};
    if (params.has_value()) {
        frame["p"] = *params;
    }
    if (id.has_value()) {
        frame["i"] = *id;
    }
    return frame;
}

std::string CommandFrame::serialize() const {
    return to_json().dump();
}

// ─────────────────────────────────────────────────────────────────────────────
// FrameDecoder
// ─────────────────────────────────────────────────────────────────────────────

FrameResult<Json> FrameDecoder::parse(std::string_view raw) {
    simdjson::padded_string padded(raw);

    simdjson::ondemand::document document;
    auto error = parser_.iterate(padded).get(document);
    if (error) {
        return tl::unexpected(from_simdjson(error));
    }

    simdjson::ondemand::json_type type;
    error = document.type().get(type);
    if (error) {
        return tl::unexpected(from_simdjson(error));
    }
    // Scalar documents cannot be frames
    const bool is_container = (type == simdjson::ondemand::json_type::object)
        || (type == simdjson::ondemand::json_type::array);
    if (is_container == false) {
        return tl::unexpected(FrameError::not_an_object());
    }

    simdjson::ondemand::value root;
    error = document.get_value().get(root);
    if (error) {
        return tl::unexpected(from_simdjson(error));
    }

    auto converted = convert(root, 0);
    if (converted.has_value() == false) {
        return converted;
    }

    // On-demand parsing only validates what it visits
    if (document.at_end() == false) {
        return tl::unexpected(FrameError::invalid_json("Trailing content after JSON document"));
    }
    return converted;
}

FrameResult<InboundFrame> FrameDecoder::decode(std::string_view raw) {
    auto document = parse(raw);
    if (document.has_value() == false) {
        return tl::unexpected(std::move(document.error()));
    }
    return classify_frame(std::move(*document));
}

FrameResult<Json> FrameDecoder::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > max_depth_) {
        return tl::unexpected(FrameError::too_deep(max_depth_));
    }

    simdjson::ondemand::json_type type;
    auto error = value.type().get(type);
    if (error) {
        return tl::unexpected(from_simdjson(error));
    }

    switch (type) {
        case simdjson::ondemand::json_type::object: {
            simdjson::ondemand::object object;
            error = value.get_object().get(object);
            if (error) {
                return tl::unexpected(from_simdjson(error));
            }
            return convert_object(object, depth + 1);
        }

        case simdjson::ondemand::json_type::array: {
            simdjson::ondemand::array array;
            error = value.get_array().get(array);
            if (error) {
                return tl::unexpected(from_simdjson(error));
            }
            return convert_array(array, depth + 1);
        }

        case simdjson::ondemand::json_type::string: {
            std::string_view text;
            error = value.get_string().get(text);
            if (error) {
                return tl::unexpected(from_simdjson(error));
            }
            return Json(std::string(text));
        }

        case simdjson::ondemand::json_type::number: {
            // get_number() consumes the value once and reports its kind
            simdjson::ondemand::number number;
            error = value.get_number().get(number);
            if (error) {
                return tl::unexpected(from_simdjson(error));
            }
            switch (number.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return Json(number.get_int64());
                case simdjson::ondemand::number_type::unsigned_integer:
                    return Json(number.get_uint64());
                case simdjson::ondemand::number_type::floating_point_number:
                    return Json(number.get_double());
                default:
                    return tl::unexpected(FrameError::invalid_json("Number out of range"));
            }
        }

        case simdjson::ondemand::json_type::boolean: {
            bool flag = false;
            error = value.get_bool().get(flag);
            if (error) {
                return tl::unexpected(from_simdjson(error));
            }
            return Json(flag);
        }

        case simdjson::ondemand::json_type::null:
            return Json(nullptr);

        default:
            break;
    }

    return tl::unexpected(FrameError::invalid_json("Unknown JSON type"));
}

FrameResult<Json> FrameDecoder::convert_object(simdjson::ondemand::object object, std::size_t depth) {
    Json result = Json::object();

    for (auto field : object) {
        std::string_view key;
        auto error = field.unescaped_key().get(key);
        if (error) {
            return tl::unexpected(from_simdjson(error));
        }
        // The key view is invalidated once the value is visited
        std::string owned_key(key);

        simdjson::ondemand::value member;
        error = field.value().get(member);
        if (error) {
            return tl::unexpected(from_simdjson(error));
        }

        auto converted = convert(member, depth);
        if (converted.has_value() == false) {
            return converted;
        }
        result[std::move(owned_key)] = std::move(*converted);
    }

    return result;
}

FrameResult<Json> FrameDecoder::convert_array(simdjson::ondemand::array array, std::size_t depth) {
    Json result = Json::array();

    for (auto element : array) {
        simdjson::ondemand::value item;
        auto error = element.get(item);
        if (error) {
            return tl::unexpected(from_simdjson(error));
        }

        auto converted = convert(item, depth);
        if (converted.has_value() == false) {
            return converted;
        }
        result.push_back(std::move(*converted));
    }

    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

FrameResult<InboundFrame> classify_frame(Json document) {
    if (document.is_object() == false) {
        return tl::unexpected(FrameError::not_an_object());
    }

    if (auto hello = document.find("hello"); hello != document.end()) {
        if (hello->is_object() == false) {
            return tl::unexpected(FrameError::invalid_field("'hello' should be an object"));
        }
        auto sid = hello->find("sid");
        const bool has_sid = (sid != hello->end()) && sid->is_string();
        if (has_sid == false) {
            return tl::unexpected(FrameError::invalid_field("'hello.sid' should be a string"));
        }
        HelloFrame frame;
        frame.session_id = sid->get<std::string>();
        auto is_new = hello->find("isNew");
        if (is_new != hello->end()) {
            if (is_new->is_boolean() == false) {
                return tl::unexpected(FrameError::invalid_field("'hello.isNew' should be a boolean"));
            }
            frame.is_new = is_new->get<bool>();
        }
        return InboundFrame{std::move(frame)};
    }

    if (auto name = document.find("n"); name != document.end()) {
        if (name->is_string() == false) {
            return tl::unexpected(FrameError::invalid_field("'n' should be a string"));
        }
        NotificationFrame frame;
        frame.name = name->get<std::string>();
        auto data = document.find("d");
        if (data != document.end()) {
            frame.data = std::move(*data);
        }
        return InboundFrame{std::move(frame)};
    }

    const auto id_member = document.find("i");
    const bool has_id = (id_member != document.end());

    if (auto result = document.find("r"); result != document.end()) {
        const auto id = has_id ? as_correlation_id(*id_member) : std::nullopt;
        if (id.has_value() == false) {
            return tl::unexpected(FrameError::invalid_field("Result frame without a valid 'i'"));
        }
        return InboundFrame{ResultFrame{*id, std::move(*result)}};
    }

    if (auto error = document.find("e"); error != document.end()) {
        const auto id = has_id ? as_correlation_id(*id_member) : std::nullopt;
        if (id.has_value() == false) {
            return tl::unexpected(FrameError::invalid_field("Error frame without a valid 'i'"));
        }
        return InboundFrame{ErrorFrame{*id, std::move(*error)}};
    }

    return tl::unexpected(FrameError::unrecognized());
}

FrameResult<InboundFrame> decode_frame(std::string_view raw) {
    thread_local FrameDecoder decoder;
    return decoder.decode(raw);
}

}  // namespace wsgate

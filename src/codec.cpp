#include "mcpsse/codec.hpp"
#include "mcpsse/error.hpp"
#include "mcpsse/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcpsse {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

// Scalar documents cannot be viewed as a value, so they are read off the
// document itself.
nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    simdjson::ondemand::json_type type = doc.type();
    switch (type) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array: {
            auto val = doc.get_value();
            if (val.error()) {
                throw McpParseError("Failed to get document value");
            }
            return simdjson_to_nlohmann(val.value());
        }
        case simdjson::ondemand::json_type::string:
            return nlohmann::json(std::string(std::string_view(doc.get_string())));
        case simdjson::ondemand::json_type::number: {
            auto result_int = doc.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            return nlohmann::json(doc.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(doc.get_bool().value());
        case simdjson::ondemand::json_type::null: {
            bool is_null = doc.is_null();
            if (!is_null) {
                throw McpParseError("Invalid literal");
            }
            return nlohmann::json(nullptr);
        }
        default:
            throw McpParseError("Unknown JSON value type");
    }
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    try {
        std::string version;
        if (j.contains("jsonrpc") && j.at("jsonrpc").is_string()) {
            version = j.at("jsonrpc").get<std::string>();
        }

        bool has_id = j.contains("id");
        bool has_method = j.contains("method");

        if (has_method) {
            if (!j.at("method").is_string()) {
                throw McpProtocolError(error::InvalidRequest, "Invalid Request: 'method' must be a string");
            }
            if (has_id) {
                JsonRpcRequest req;
                req.jsonrpc = version;
                from_json(j.at("id"), req.id);
                req.method = j.at("method").get<std::string>();
                if (j.contains("params")) req.params = j.at("params");
                return req;
            }
            JsonRpcNotification notif;
            notif.jsonrpc = version;
            notif.method = j.at("method").get<std::string>();
            if (j.contains("params")) notif.params = j.at("params");
            return notif;
        }

        if (j.contains("result") || j.contains("error")) {
            JsonRpcResponse resp;
            if (has_id) from_json(j.at("id"), resp.id);
            if (j.contains("error")) {
                resp.error = j.at("error").get<JsonRpcError>();
            } else {
                resp.result = j.at("result");
            }
            return resp;
        }

        if (has_id) {
            // No method at all: routed as a request so the id is still echoed.
            JsonRpcRequest req;
            req.jsonrpc = version;
            from_json(j.at("id"), req.id);
            if (j.contains("params")) req.params = j.at("params");
            return req;
        }
    } catch (const std::invalid_argument& e) {
        throw McpProtocolError(error::InvalidRequest, std::string("Invalid Request: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw McpProtocolError(error::InvalidRequest, std::string("Invalid Request: ") + e.what());
    }

    throw McpProtocolError(error::InvalidRequest,
        "Invalid Request: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    // Use simdjson for fast parsing
    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    // Convert to nlohmann for further processing
    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
        if (!doc.at_end()) {
            throw McpParseError("Trailing content after JSON document");
        }
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON conversion error: ") + e.what());
    }

    if (!j.is_object()) {
        throw McpProtocolError(error::InvalidRequest, "Invalid Request: message must be a JSON object");
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

std::string Codec::sse_frame(const JsonRpcMessage& msg) {
    return "data: " + serialize(msg) + "\n\n";
}

JsonRpcResponse Codec::make_result(RequestId id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse Codec::make_error(RequestId id, JsonRpcError error) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = std::move(error);
    return resp;
}

JsonRpcNotification Codec::make_notification(std::string method, nlohmann::json params) {
    JsonRpcNotification notif;
    notif.method = std::move(method);
    notif.params = std::move(params);
    return notif;
}

} // namespace mcpsse

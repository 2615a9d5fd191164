#include "rapidmcp/codec.hpp"
#include "rapidmcp/error.hpp"
#include "rapidmcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace rapidmcp {

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

// Picks the top-level "id" member out of SAX events. Events stop at the first
// syntax error, so ids ahead of the damage are still seen.
class IdCollector : public nlohmann::json::json_sax_t {
public:
    std::optional<RequestId> id;

    bool null() override { return value(RequestId{nullptr}); }
    bool boolean(bool) override { return value(std::nullopt); }
    bool number_integer(number_integer_t v) override { return value(RequestId{static_cast<int64_t>(v)}); }
    bool number_unsigned(number_unsigned_t v) override {
        if (v > static_cast<number_unsigned_t>(std::numeric_limits<int64_t>::max())) {
            return value(std::nullopt);
        }
        return value(RequestId{static_cast<int64_t>(v)});
    }
    bool number_float(number_float_t, const string_t&) override { return value(std::nullopt); }
    bool string(string_t& s) override { return value(RequestId{s}); }
    bool binary(binary_t&) override { return value(std::nullopt); }

    bool start_object(std::size_t) override { return open(true); }
    bool end_object() override { --depth_; return true; }
    bool start_array(std::size_t) override { return open(false); }
    bool end_array() override { --depth_; return true; }

    bool key(string_t& k) override {
        if (depth_ == 1) at_id_ = (k == "id");
        return true;
    }

    bool parse_error(std::size_t, const std::string&, const nlohmann::json::exception&) override {
        return false;
    }

private:
    // Returning false stops the parse.
    bool value(std::optional<RequestId> v) {
        if (depth_ == 0) return false;
        if (depth_ == 1 && at_id_) {
            id = std::move(v);
            return false;
        }
        return true;
    }

    bool open(bool object) {
        if (depth_ == 0 && !object) return false;
        if (depth_ == 1 && at_id_) return false;
        ++depth_;
        return true;
    }

    int depth_ = 0;
    bool at_id_ = false;
};

bool valid_id(const nlohmann::json& id) {
    return id.is_null() || id.is_string() || id.is_number_integer();
}

[[noreturn]] void invalid_request(const std::string& msg) {
    throw McpProtocolError(error::InvalidRequest, msg);
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto version_it = j.find("jsonrpc");
    if (version_it == j.end()) {
        invalid_request("Missing 'jsonrpc' field");
    }
    if (!version_it->is_string() || version_it->get<std::string>() != JSONRPC_VERSION) {
        invalid_request("Invalid jsonrpc version, expected '2.0'");
    }

    auto id_it = j.find("id");
    auto method_it = j.find("method");
    bool has_id = id_it != j.end();
    bool has_method = method_it != j.end();

    if (has_id && !valid_id(*id_it)) {
        invalid_request("'id' must be a string, an integer or null");
    }

    if (has_method) {
        if (!method_it->is_string()) {
            invalid_request("'method' must be a string");
        }
        std::optional<nlohmann::json> params;
        if (j.contains("params")) {
            const auto& p = j.at("params");
            if (!p.is_object() && !p.is_array() && !p.is_null()) {
                invalid_request("'params' must be an object or an array");
            }
            if (!p.is_null()) params = p;
        }
        if (has_id) {
            JsonRpcRequest req;
            from_json(*id_it, req.id);
            req.method = method_it->get<std::string>();
            req.params = std::move(params);
            return req;
        }
        JsonRpcNotification notif;
        notif.method = method_it->get<std::string>();
        notif.params = std::move(params);
        return notif;
    }

    if (has_id) {
        JsonRpcResponse resp;
        from_json(*id_it, resp.id);
        if (j.contains("result")) resp.result = j.at("result");
        if (j.contains("error")) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception& e) {
                invalid_request(std::string("Malformed 'error' member: ") + e.what());
            }
        }
        if (!resp.result && !resp.error) {
            invalid_request("Response carries neither 'result' nor 'error'");
        }
        return resp;
    }

    invalid_request("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    simdjson::ondemand::json_type type;
    error = doc.type().get(type);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }
    if (type != simdjson::ondemand::json_type::object) {
        invalid_request("Message must be a JSON object");
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::value root = doc.get_value();
        j = simdjson_to_nlohmann(root);
        if (!doc.at_end()) {
            throw McpParseError("Trailing content after JSON value");
        }
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }

    return parse_object(j);
}

std::optional<RequestId> Codec::recover_id(std::string_view raw) {
    if (raw.empty()) return std::nullopt;

    IdCollector collector;
    (void)nlohmann::json::sax_parse(raw.begin(), raw.end(), &collector,
                                    nlohmann::json::input_format_t::json, false);
    return collector.id;
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace rapidmcp

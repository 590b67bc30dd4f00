#include "richdoc/delta/delta_json.h"
#include <limits>
#include <type_traits>
#include <variant>
#include <stdexcept>

namespace richdoc::delta {

namespace {

using json = nlohmann::ordered_json;

json valueToJson(const AttributeValue& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return v;
        }
    }, value);
}

AttributeValue valueFromJson(const std::string& key, const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return std::monostate{};
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
            return value.get<std::int64_t>();
        case json::value_t::number_unsigned: {
            const auto u = value.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw std::runtime_error("Delta attribute '" + key + "' is out of integer range");
            }
            return static_cast<std::int64_t>(u);
        }
        case json::value_t::number_float:
            return value.get<double>();
        case json::value_t::string:
            return value.get<std::string>();
        default:
            throw std::runtime_error("Delta attribute '" + key + "' must be a scalar value");
    }
}

std::uint32_t readLength(const json& record, const char* field, std::size_t index) {
    const json& v = record.at(field);
    if (!v.is_number_integer() || v.get<std::int64_t>() <= 0
        || v.get<std::int64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error("Delta record " + std::to_string(index) + ": '" + field
            + "' must be a positive integer");
    }
    return static_cast<std::uint32_t>(v.get<std::int64_t>());
}

} // namespace

// =============================================================================
// Encoding
// =============================================================================

json attributesToJson(const AttributeMap& attributes) {
    json out = json::object();
    for (const auto& [key, value] : attributes) {
        out[key] = valueToJson(value);
    }
    return out;
}

json deltaToJson(const Delta& delta) {
    json out = json::array();
    for (const Operation& op : delta) {
        json record = json::object();
        switch (op.type) {
            case OpType::Insert:
                if (op.embed) {
                    json embed = json::object();
                    embed[op.embed->type] = op.embed->data;
                    record["insert"] = std::move(embed);
                } else {
                    record["insert"] = op.text;
                }
                break;
            case OpType::Retain:
                record["retain"] = op.length;
                break;
            case OpType::Delete:
                record["delete"] = op.length;
                break;
        }
        if (op.hasAttributes()) {
            record["attributes"] = attributesToJson(op.attributes);
        }
        out.push_back(std::move(record));
    }
    return out;
}

std::string deltaToJsonString(const Delta& delta, int indent) {
    return deltaToJson(delta).dump(indent);
}

// =============================================================================
// Decoding
// =============================================================================

AttributeMap attributesFromJson(const json& attributes) {
    if (!attributes.is_object()) {
        throw std::runtime_error("Delta attributes must be an object");
    }
    AttributeMap out;
    for (const auto& item : attributes.items()) {
        out.set(item.key(), valueFromJson(item.key(), item.value()));
    }
    return out;
}

Delta deltaFromJson(const json& ops) {
    if (!ops.is_array()) {
        throw std::runtime_error("Delta JSON must be an array of operations");
    }

    Delta out;
    for (std::size_t i = 0; i < ops.size(); ++i) {
        const json& record = ops[i];
        if (!record.is_object()) {
            throw std::runtime_error("Delta record " + std::to_string(i) + " is not an object");
        }

        const int kinds = static_cast<int>(record.contains("insert"))
            + static_cast<int>(record.contains("retain"))
            + static_cast<int>(record.contains("delete"));
        if (kinds != 1) {
            throw std::runtime_error("Delta record " + std::to_string(i)
                + " must hold exactly one of insert, retain or delete");
        }

        AttributeMap attributes;
        if (record.contains("attributes") && !record.at("attributes").is_null()) {
            attributes = attributesFromJson(record.at("attributes"));
        }

        if (record.contains("insert")) {
            const json& data = record.at("insert");
            if (data.is_string()) {
                out.insert(data.get<std::string>(), std::move(attributes));
            } else if (data.is_object() && data.size() == 1 && data.begin().value().is_string()) {
                Embed embed{data.begin().key(), data.begin().value().get<std::string>()};
                out.insert(std::move(embed), std::move(attributes));
            } else {
                throw std::runtime_error("Delta record " + std::to_string(i)
                    + ": insert must be a string or a single-key embed object");
            }
        } else if (record.contains("retain")) {
            out.retain(readLength(record, "retain", i), std::move(attributes));
        } else {
            if (!attributes.empty()) {
                throw std::runtime_error("Delta record " + std::to_string(i) + ": delete cannot carry attributes");
            }
            out.remove(readLength(record, "delete", i));
        }
    }
    return out;
}

Delta deltaFromJsonString(std::string_view text) {
    json parsed;
    try {
        parsed = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed delta JSON: ") + e.what());
    }
    return deltaFromJson(parsed);
}

} // namespace richdoc::delta

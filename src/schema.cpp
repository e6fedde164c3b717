#include "mcpsse/schema.hpp"
#include <algorithm>

namespace mcpsse {

namespace {

bool matches_type(const std::string& type, const nlohmann::json& value) {
    if (type == "string")  return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number")  return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "null")    return value.is_null();
    return true;
}

} // anonymous namespace

std::vector<std::string> validate_arguments(const nlohmann::json& schema,
                                            const nlohmann::json& arguments) {
    std::vector<std::string> violations;
    if (!schema.is_object()) return violations;

    if (schema.value("type", std::string{}) == "object" && !arguments.is_object()) {
        violations.push_back("arguments must be an object");
        return violations;
    }
    if (!arguments.is_object()) return violations;

    if (schema.contains("required") && schema.at("required").is_array()) {
        for (const auto& name : schema.at("required")) {
            if (name.is_string() && !arguments.contains(name.get<std::string>())) {
                violations.push_back("missing required argument '" + name.get<std::string>() + "'");
            }
        }
    }

    if (!schema.contains("properties") || !schema.at("properties").is_object()) {
        return violations;
    }
    const auto& properties = schema.at("properties");
    for (auto arg = arguments.begin(); arg != arguments.end(); ++arg) {
        const std::string& name = arg.key();
        const nlohmann::json& value = arg.value();
        auto it = properties.find(name);
        if (it == properties.end() || !it->is_object()) continue;

        const auto& prop = *it;
        if (prop.contains("type") && prop.at("type").is_string()) {
            const std::string type = prop.at("type").get<std::string>();
            if (!matches_type(type, value)) {
                violations.push_back("argument '" + name + "' must be of type " + type);
                continue;
            }
        }
        if (prop.contains("enum") && prop.at("enum").is_array()) {
            const auto& allowed = prop.at("enum");
            if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
                violations.push_back("argument '" + name + "' must be one of " + allowed.dump());
            }
        }
    }
    return violations;
}

} // namespace mcpsse

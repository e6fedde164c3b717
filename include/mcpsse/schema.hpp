#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpsse {

/// Check tool arguments against the subset of JSON Schema used by tool
/// descriptors: top-level object type, `required`, the primitive `type`
/// of each declared property, and `enum`.
///
/// Returns one message per violation; empty means the arguments conform.
/// Keywords outside that subset are ignored.
[[nodiscard]] std::vector<std::string> validate_arguments(const nlohmann::json& schema,
                                                          const nlohmann::json& arguments);

} // namespace mcpsse

#include "mcpsse/data_provider.hpp"
#include "mcpsse/error.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcpsse {

namespace {

// Missing arguments render as "undefined", non-strings as their JSON text.
std::string arg_text(const nlohmann::json& arguments, const char* key) {
    if (!arguments.is_object() || !arguments.contains(key)) return "undefined";
    const auto& v = arguments.at(key);
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

} // anonymous namespace

std::string iso8601_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

StubDataProvider::StubDataProvider(TimestampFn now)
    : now_(now ? std::move(now) : TimestampFn(iso8601_now)) {}

std::string StubDataProvider::invoke(const std::string& tool,
                                     const nlohmann::json& arguments) {
    if (tool == "search") return search(arguments);
    if (tool == "retrieve") return retrieve(arguments);
    throw McpError("No data source for tool: " + tool);
}

std::string StubDataProvider::search(const nlohmann::json& arguments) const {
    std::ostringstream oss;
    oss << "GoHighLevel Search Results for: \"" << arg_text(arguments, "query") << "\"\n\n"
        << "✅ Found Results:\n"
        << "• Contact: John Doe (john@example.com)\n"
        << "• Contact: Jane Smith (jane@example.com)\n"
        << "• Conversation: \"Follow-up call scheduled\"\n"
        << "• Blog Post: \"How to Generate More Leads\"\n\n"
        << "\U0001F4CA Search completed successfully in GoHighLevel CRM.";
    return oss.str();
}

std::string StubDataProvider::retrieve(const nlohmann::json& arguments) const {
    const std::string type = arg_text(arguments, "type");
    std::ostringstream oss;
    oss << "GoHighLevel " << type << " Retrieved: ID " << arg_text(arguments, "id") << "\n\n"
        << "\U0001F4C4 Details:\n"
        << "• Name: Sample " << type << "\n"
        << "• Status: Active\n"
        << "• Last Updated: " << now_() << "\n"
        << "• Source: GoHighLevel CRM\n\n"
        << "✅ Data retrieved successfully from GoHighLevel.";
    return oss.str();
}

} // namespace mcpsse

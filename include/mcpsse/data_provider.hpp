#pragma once
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpsse {

/// Backing data source consumed by tools/call.
///
/// Returns the free-text result of running `tool` with `arguments`, or
/// throws. Any exception surfaces to the caller as an InternalError
/// response.
class IDataProvider {
public:
    virtual ~IDataProvider() = default;

    [[nodiscard]] virtual std::string invoke(const std::string& tool,
                                             const nlohmann::json& arguments) = 0;
};

/// Canned CRM responses for the `search` and `retrieve` tools.
class StubDataProvider : public IDataProvider {
public:
    using TimestampFn = std::function<std::string()>;

    /// `now` formats the "Last Updated" stamp; defaults to the current UTC
    /// time in ISO-8601 with milliseconds.
    explicit StubDataProvider(TimestampFn now = nullptr);

    std::string invoke(const std::string& tool,
                       const nlohmann::json& arguments) override;

private:
    std::string search(const nlohmann::json& arguments) const;
    std::string retrieve(const nlohmann::json& arguments) const;

    TimestampFn now_;
};

/// Current UTC time as e.g. "2024-11-05T10:00:00.000Z".
std::string iso8601_now();

} // namespace mcpsse

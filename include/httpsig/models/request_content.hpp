#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace httpsig::auth::models {

/**
 * @brief The signable parts of an outgoing HTTP request
 *
 * Header names are stored lower-cased in first-insertion order. The request
 * line is exposed as the "(request-target)" pseudo-header.
 */
class RequestContent {
public:
    class Builder {
    public:
        Builder& SetRequestTarget(std::string_view method, std::string_view path);
        Builder& SetDate(std::chrono::system_clock::time_point date);
        Builder& SetDate(std::string_view date);
        Builder& AddHeader(std::string_view name, std::string_view value);
        [[nodiscard]] RequestContent Build() const;

    private:
        std::vector<std::pair<std::string, std::vector<std::string>>> headers_;
        void Put(std::string_view name, std::string_view value, bool replace);
    };

    [[nodiscard]] std::vector<std::string> GetHeaderNames() const;

    /// Empty when the header is absent.
    [[nodiscard]] std::vector<std::string> GetHeaderValues(std::string_view name) const;

    [[nodiscard]] bool HasHeader(std::string_view name) const;

    /**
     * @brief Canonical signing string for the given headers
     *
     * One "name: value" line per requested header that is present, joined by
     * '\n'. Repeated header values are joined with ", ". Absent headers are
     * skipped.
     */
    [[nodiscard]] std::string GetContent(const std::vector<std::string>& headers) const;

    /// UTF-8 bytes of GetContent().
    [[nodiscard]] std::vector<uint8_t> GetBytesToSign(const std::vector<std::string>& headers) const;

    /// RFC 1123 date as used by the Date header, always GMT.
    [[nodiscard]] static std::string FormatHttpDate(std::chrono::system_clock::time_point date);

private:
    explicit RequestContent(std::vector<std::pair<std::string, std::vector<std::string>>> headers);

    std::vector<std::pair<std::string, std::vector<std::string>>> headers_;
};
}

#include "httpsig/models/request_content.hpp"
#include "httpsig/models/header_names.hpp"
#include "httpsig/core/constants.hpp"
#include "httpsig/core/format.hpp"

#include <algorithm>
#include <ctime>

namespace httpsig::auth::models {

namespace {
    using HeaderEntry = std::pair<std::string, std::vector<std::string>>;

    auto FindHeader(const std::vector<HeaderEntry>& headers, const std::string& normalized) {
        return std::find_if(headers.begin(), headers.end(),
            [&normalized](const HeaderEntry& entry) { return entry.first == normalized; });
    }
}

// ============================================================================
// Builder
// ============================================================================

RequestContent::Builder& RequestContent::Builder::SetRequestTarget(
    const std::string_view method,
    const std::string_view path) {
    Put(SignatureConstants::HEADER_REQUEST_TARGET,
        compat::format("{} {}", HeaderNames::Normalize(method), path),
        true);
    return *this;
}

RequestContent::Builder& RequestContent::Builder::SetDate(
    const std::chrono::system_clock::time_point date) {
    Put(SignatureConstants::HEADER_DATE, FormatHttpDate(date), true);
    return *this;
}

RequestContent::Builder& RequestContent::Builder::SetDate(const std::string_view date) {
    Put(SignatureConstants::HEADER_DATE, date, true);
    return *this;
}

RequestContent::Builder& RequestContent::Builder::AddHeader(
    const std::string_view name,
    const std::string_view value) {
    Put(name, value, false);
    return *this;
}

RequestContent RequestContent::Builder::Build() const {
    return RequestContent(headers_);
}

void RequestContent::Builder::Put(
    const std::string_view name,
    const std::string_view value,
    const bool replace) {
    std::string normalized = HeaderNames::Normalize(name);
    auto it = std::find_if(headers_.begin(), headers_.end(),
        [&normalized](const HeaderEntry& entry) { return entry.first == normalized; });
    if (it == headers_.end()) {
        headers_.emplace_back(std::move(normalized), std::vector<std::string>{std::string(value)});
        return;
    }
    if (replace) {
        it->second.clear();
    }
    it->second.emplace_back(value);
}

// ============================================================================
// RequestContent
// ============================================================================

RequestContent::RequestContent(std::vector<HeaderEntry> headers)
    : headers_(std::move(headers)) {
}

std::vector<std::string> RequestContent::GetHeaderNames() const {
    std::vector<std::string> names;
    names.reserve(headers_.size());
    for (const auto& [name, values] : headers_) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> RequestContent::GetHeaderValues(const std::string_view name) const {
    const auto it = FindHeader(headers_, HeaderNames::Normalize(name));
    if (it == headers_.end()) {
        return {};
    }
    return it->second;
}

bool RequestContent::HasHeader(const std::string_view name) const {
    return FindHeader(headers_, HeaderNames::Normalize(name)) != headers_.end();
}

std::string RequestContent::GetContent(const std::vector<std::string>& headers) const {
    std::vector<std::string> lines;
    lines.reserve(headers.size());
    for (const auto& header : headers) {
        const std::string normalized = HeaderNames::Normalize(header);
        const auto it = FindHeader(headers_, normalized);
        if (it == headers_.end()) {
            continue;
        }
        lines.push_back(compat::format("{}{}{}",
            normalized,
            SignatureConstants::HEADER_NAME_SEPARATOR,
            compat::join(it->second, SignatureConstants::HEADER_VALUE_SEPARATOR)));
    }
    return compat::format("{}", compat::join(lines, SignatureConstants::CONTENT_LINE_SEPARATOR));
}

std::vector<uint8_t> RequestContent::GetBytesToSign(const std::vector<std::string>& headers) const {
    const std::string content = GetContent(headers);
    return std::vector<uint8_t>(content.begin(), content.end());
}

std::string RequestContent::FormatHttpDate(const std::chrono::system_clock::time_point date) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(date);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    // no 'L' specifier: day and month names stay English whatever the locale
    return compat::format("{:%a, %d %b %Y %H:%M:%S} GMT", utc);
}

}

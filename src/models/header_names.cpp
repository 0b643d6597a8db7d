#include "httpsig/models/header_names.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace httpsig::auth::models {

std::string HeaderNames::Normalize(const std::string_view name) {
    std::string normalized(name);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
        [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

std::vector<std::string> HeaderNames::NormalizeUnique(const std::vector<std::string>& names) {
    return Union({}, names);
}

std::vector<std::string> HeaderNames::Union(
    const std::vector<std::string>& base,
    const std::vector<std::string>& extra) {
    std::vector<std::string> ordered;
    ordered.reserve(base.size() + extra.size());
    std::unordered_set<std::string> seen;

    auto append = [&ordered, &seen](const std::vector<std::string>& names) {
        for (const auto& name : names) {
            std::string normalized = Normalize(name);
            if (seen.insert(normalized).second) {
                ordered.push_back(std::move(normalized));
            }
        }
    };
    append(base);
    append(extra);
    return ordered;
}

}

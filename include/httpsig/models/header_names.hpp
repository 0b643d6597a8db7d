#pragma once
#include <string>
#include <string_view>
#include <vector>
namespace httpsig::auth::models {
class HeaderNames {
public:
    [[nodiscard]] static std::string Normalize(std::string_view name);

    /// Lower-cases every name and drops repeats, keeping first-occurrence order.
    [[nodiscard]] static std::vector<std::string> NormalizeUnique(const std::vector<std::string>& names);

    /// Appends the names of extra not already present in base, in order.
    [[nodiscard]] static std::vector<std::string> Union(
        const std::vector<std::string>& base,
        const std::vector<std::string>& extra);

private:
    HeaderNames() = delete;
};
}

#pragma once

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <fmt/ranges.h>

namespace httpsig::compat {
    using fmt::format;
    using fmt::join;
}

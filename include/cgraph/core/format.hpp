#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

namespace cgraph::compat {
    using fmt::format;
}

#pragma once

#include <fmt/core.h>

namespace synccrypto::compat {
    using fmt::format;
}

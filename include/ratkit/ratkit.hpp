// include/ratkit/ratkit.hpp — Umbrella header that exposes ratkit components.

#pragma once

// Users should generally include only this file.

#include <ratkit/core/bigint.hpp>
#include <ratkit/core/rational.hpp>
#include <ratkit/io/format.hpp>
#include <ratkit/util/debug.hpp>
#include <ratkit/util/random.hpp>

namespace ratkit {

    using core::bigint;
    using core::rational;
    using core::sign_t;

    inline constexpr int RATKIT_VERSION_MAJOR = 0;
    inline constexpr int RATKIT_VERSION_MINOR = 1;
    inline constexpr int RATKIT_VERSION_PATCH = 0;

} // namespace ratkit

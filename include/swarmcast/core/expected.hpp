#pragma once

#include "swarmcast/core/error.hpp"

#if SWARMCAST_HAVE_STD_EXPECTED && __has_include(<expected>)
#include <expected>
#else
#include <tl/expected.hpp>
#endif

namespace swarmcast {

#if SWARMCAST_HAVE_STD_EXPECTED && __has_include(<expected>)

template <class T>
using Expected = std::expected<T, Error>;

template <class E>
using unexpected = std::unexpected<E>;

#else

template <class T>
using Expected = tl::expected<T, Error>;

template <class E>
using unexpected = tl::unexpected<E>;

#endif

}  // namespace swarmcast

#ifndef CSLC_ASSERT_HPP
#define CSLC_ASSERT_HPP

#include "ulight/impl/assert.hpp"

#define CSLC_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define CSLC_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

#endif

#ifndef CSLC_UNICODE_HPP
#define CSLC_UNICODE_HPP

#include "ulight/impl/unicode.hpp"
#include "ulight/impl/unicode_algorithm.hpp"

namespace cslc::utf8 {

using ulight::utf8::is_valid;

} // namespace cslc::utf8

#endif

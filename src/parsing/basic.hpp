#ifndef NODEBOOK_PARSING_BASIC_HPP
#define NODEBOOK_PARSING_BASIC_HPP

#include <limits>
#include <optional>
#include <string_view>
#include <common.hpp>

namespace nodebook::parsing {
#include "macros_open.hpp"

  // Assuming 8-bit code units (UTF-8).
  using Char = uint8_t;
  constexpr Char CharMax = std::numeric_limits<Char>::max();

  // Token kind IDs recognised by an automaton.
  using Symbol = uint32_t;

  // Operator binding strength (higher binds tighter).
  using Precedence = uint32_t;

#include "macros_close.hpp"
}

#endif // NODEBOOK_PARSING_BASIC_HPP

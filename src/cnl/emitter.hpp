#ifndef NODEBOOK_CNL_EMITTER_HPP
#define NODEBOOK_CNL_EMITTER_HPP

#include <string>
#include <graph/graph.hpp>

namespace nodebook::cnl {
#include "macros_open.hpp"

  // Writes a graph back as CNL text.
  // Derived attributes become `has function` lines; their values are not written.
  auto emit(graph::Graph const& g) -> std::string;

#include "macros_close.hpp"
}

#endif // NODEBOOK_CNL_EMITTER_HPP

#ifndef NODEBOOK_COMPILER_EVALUATOR_HPP
#define NODEBOOK_COMPILER_EVALUATOR_HPP

#include <set>
#include <string>
#include <vector>
#include "resolver.hpp"

namespace nodebook::compiler {
#include "macros_open.hpp"

  struct Evaluation {
    std::vector<graph::Attribute> derived; // One per function that could be evaluated.
    std::vector<std::string> recomputed;   // IDs of derived attributes whose value was not taken from `prior`.
    std::set<std::string> failed;          // IDs of derived attributes that could not be evaluated.
  };

  // Evaluates the applied functions in dependency order.
  // Values whose inputs did not change since `prior` are reused instead of recomputed.
  auto evaluate(ResolvedGraph const& resolved, graph::Graph const& prior, cnl::Reporter& reporter) -> Evaluation;

#include "macros_close.hpp"
}

#endif // NODEBOOK_COMPILER_EVALUATOR_HPP

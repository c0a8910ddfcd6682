#ifndef NODEBOOK_COMPILER_DIFF_HPP
#define NODEBOOK_COMPILER_DIFF_HPP

#include <vector>
#include "evaluator.hpp"
#include "options.hpp"
#include "resolver.hpp"

namespace nodebook::compiler {
#include "macros_open.hpp"

  // Computes the changes that turn `prior` into the graph described by a submission.
  //
  // Relations and attributes are tracked per morph: a submission restates the full contents of the morphs it
  // touches (the default morph and the declared morphs of every node it declares), and leaves all other
  // morphs alone. An entity is deleted once it belongs to no morph at all.
  //
  // Changes are ordered as: deletions (attributes, relations, nodes), updates (graph, nodes, relations,
  // attributes), creations (nodes, relations, attributes). Contradictory declarations of the same ID are
  // reported as `IdentityConflict`, in which case the result must not be applied.
  //
  // A declaration that was skipped because of an error keeps the stored entity with the same ID unchanged.
  auto diff(
    graph::Graph const& prior,
    ResolvedGraph const& resolved,
    Evaluation const& evaluation,
    CompileOptions const& options,
    cnl::Reporter& reporter
  ) -> graph::ChangeList;

#include "macros_close.hpp"
}

#endif // NODEBOOK_COMPILER_DIFF_HPP

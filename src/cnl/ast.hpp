#ifndef NODEBOOK_CNL_AST_HPP
#define NODEBOOK_CNL_AST_HPP

#include <optional>
#include <string>
#include <vector>
#include <common.hpp>

namespace nodebook::cnl {
#include "macros_open.hpp"

  // Children of a node carry the name of the morph they were declared under.

  struct RelationDecl {
    size_t line;
    std::string morph;
    std::string name;
    std::string target;
    std::optional<std::string> adverb;
    std::optional<std::string> adjective; // Of the target.
    std::optional<std::string> modality;
  };

  struct AttributeDecl {
    size_t line;
    std::string morph;
    std::string name;
    std::string value;
    std::optional<std::string> quantifier;
    std::optional<std::string> unit;
    std::optional<std::string> modality;
  };

  struct FunctionDecl {
    size_t line;
    std::string morph;
    std::string name;
  };

  struct MorphDecl {
    size_t line;
    std::string name;
  };

  struct NodeDecl {
    size_t line;
    std::string baseName;
    std::optional<std::string> adjective;
    std::optional<std::string> quantifier;
    std::vector<std::string> types;
    std::optional<std::string> description;
    std::vector<MorphDecl> morphs; // Excluding the default morph.
    std::vector<RelationDecl> relations;
    std::vector<AttributeDecl> attributes;
    std::vector<FunctionDecl> functions;
  };

  struct Document {
    std::optional<std::string> description;
    std::vector<NodeDecl> nodes; // In order of first declaration.
  };

#include "macros_close.hpp"
}

#endif // NODEBOOK_CNL_AST_HPP

#ifndef NODEBOOK_CNL_PARSER_HPP
#define NODEBOOK_CNL_PARSER_HPP

#include <unordered_map>
#include "ast.hpp"
#include "diagnostics.hpp"
#include "lines.hpp"

namespace nodebook::cnl {
#include "macros_open.hpp"

  // Groups classified lines into node blocks.
  // Headings with the same base name continue the earlier block.
  class BlockParser {
  public:
    explicit BlockParser(Reporter& reporter):
        _reporter(reporter) {}

    auto parse(std::vector<Line> const& lines) -> Document;

  private:
    struct Capture {
      FenceKind kind;
      size_t line;
      std::vector<std::string> text;
      bool discard;
    };

    Reporter& _reporter;
    Document _document;
    std::unordered_map<std::string, size_t> _index; // Node ID -> index in `_document.nodes`.
    std::optional<size_t> _current;                 // Node receiving children.
    std::string _morph;                             // Morph receiving children.
    bool _orphaned = false;                         // Children follow an invalid heading.
    std::optional<Capture> _capture;

    auto _heading(size_t line, NodeHeading const& h) -> void;
    auto _morphHeading(size_t line, MorphHeading const& h) -> void;
    auto _owner(size_t line, std::string const& what) -> NodeDecl*;
    auto _close() -> void;
  };

  // Classifies and parses `source`.
  auto parse(std::string_view source, Reporter& reporter) -> Document;

#include "macros_close.hpp"
}

#endif // NODEBOOK_CNL_PARSER_HPP

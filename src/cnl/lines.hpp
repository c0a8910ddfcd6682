#ifndef NODEBOOK_CNL_LINES_HPP
#define NODEBOOK_CNL_LINES_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <parsing/lexer.hpp>

namespace nodebook::cnl {
#include "macros_open.hpp"

  enum class FenceKind { description, graphDescription };

  // clang-format off
  struct BlankLine    { auto operator==(BlankLine const&)    const -> bool = default; };
  struct FenceClose   { auto operator==(FenceClose const&)   const -> bool = default; };
  struct FenceOpen    { FenceKind kind;             auto operator==(FenceOpen const&)    const -> bool = default; };
  struct VerbatimLine { std::string text;           auto operator==(VerbatimLine const&) const -> bool = default; };
  struct MorphHeading { std::string name;           auto operator==(MorphHeading const&) const -> bool = default; };
  struct FunctionLine { std::string name;           auto operator==(FunctionLine const&) const -> bool = default; };
  struct InvalidLine  { std::string message; bool heading = false; auto operator==(InvalidLine const&) const -> bool = default; };
  // clang-format on

  // `# [**adjective**] [++quantifier++] Name [Type1; Type2]`
  struct NodeHeading {
    std::string name;
    std::optional<std::string> adjective;
    std::optional<std::string> quantifier;
    std::vector<std::string> types;

    auto operator==(NodeHeading const&) const -> bool = default;
  };

  // `[++adverb++] <name> [**adjective**] Target [[modality]];`
  struct RelationLine {
    std::string name;
    std::string target;
    std::optional<std::string> adverb;
    std::optional<std::string> adjective; // Of the target.
    std::optional<std::string> modality;

    auto operator==(RelationLine const&) const -> bool = default;
  };

  // `has name: [++quantifier++] value [*unit*] [[modality]];`
  struct AttributeLine {
    std::string name;
    std::string value;
    std::optional<std::string> quantifier;
    std::optional<std::string> unit;
    std::optional<std::string> modality;

    auto operator==(AttributeLine const&) const -> bool = default;
  };

  using LineContent = std::variant<
    BlankLine,
    NodeHeading,
    MorphHeading,
    RelationLine,
    AttributeLine,
    FunctionLine,
    FenceOpen,
    FenceClose,
    VerbatimLine,
    InvalidLine>;

  struct Line {
    size_t number; // Starting from 1.
    LineContent content;
  };

  // Plain text of a segment, with inline modifiers taken out.
  struct Segment {
    std::string text;
    std::optional<std::string> adjective;
    std::optional<std::string> quantifier;
    std::optional<std::string> unit;
    std::optional<std::string> modality;
  };

  struct SyntaxError: std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  class LineClassifier {
  public:
    LineClassifier();

    // Splits `source` into numbered, classified lines.
    // Lines between an opening and a closing fence come out as `VerbatimLine`s.
    auto classify(std::string_view source) const -> std::vector<Line>;

    // Classifies a line that is not inside a fence.
    auto classifyLine(std::string_view line) const -> LineContent;

    // Extracts `**adjective**`, `++quantifier++`, `*unit*` and `[modality]` from a segment.
    // Text inside double quotes is never scanned for modifiers.
    // Throws `SyntaxError` on stray or repeated markers.
    auto scan(std::string_view segment) const -> Segment;

  private:
    parsing::DFA _automaton;

    auto _heading(std::string_view line) const -> LineContent;
    auto _relation(std::string_view line) const -> LineContent;
    auto _attribute(std::string_view line) const -> LineContent;
  };

  // Shared instance.
  auto classifier() -> LineClassifier const&;

  auto trim(std::string_view s) -> std::string_view;

#include "macros_close.hpp"
}

#endif // NODEBOOK_CNL_LINES_HPP

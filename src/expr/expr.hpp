#ifndef NODEBOOK_EXPR_EXPR_HPP
#define NODEBOOK_EXPR_EXPR_HPP

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <common.hpp>

namespace nodebook::expr {
#include "macros_open.hpp"

  // clang-format off
  struct Expr;
  struct Number    { double val; };
  struct Reference { std::string name; };
  struct Negate    { Expr const* operand; };
  struct Binary    { char op; Expr const* lhs; Expr const* rhs; };
  struct Call      { std::string func; std::vector<Expr const*> args; };
  // clang-format on

  // Arithmetic expression tree. Nodes are owned by the enclosing `Expression`.
  struct Expr: std::variant<Number, Reference, Negate, Binary, Call> {
    using variant::variant;
  };

  struct ParseError: std::runtime_error {
    size_t position; // Byte offset in the source.
    ParseError(std::string const& s, size_t position):
        std::runtime_error(s),
        position(position) {}
  };

  struct EvalError: std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // A parsed function expression, e.g. `"mass number" - "atomic number"` or `sqrt(x^2 + y^2)`.
  // Names are bare identifiers or double-quoted strings.
  class Expression {
  public:
    // Throws `ParseError`.
    static auto parse(std::string source) -> Expression;

    auto source() const -> std::string const& { return _source; }
    // Referenced names, in order of first appearance.
    auto references() const -> std::vector<std::string> const& { return _references; }

    // Throws `EvalError` on unresolved names, division by zero and non-finite results.
    auto evaluate(std::function<std::optional<double>(std::string const&)> const& lookup) const -> double;

  private:
    static constexpr size_t blockSize = 64;

    std::string _source;
    Allocator<Expr> _pool = Allocator<Expr>(blockSize);
    Expr const* _root = nullptr;
    std::vector<std::string> _references;

    Expression() = default;
  };

#include "macros_close.hpp"
}

#endif // NODEBOOK_EXPR_EXPR_HPP

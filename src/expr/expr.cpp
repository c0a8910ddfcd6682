#include "expr.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <parsing/lexer.hpp>

namespace nodebook::expr {
#include "macros_open.hpp"

  using parsing::AutomatonBuilder, parsing::Precedence, parsing::Symbol, parsing::Token;

  // Pattern IDs.
  enum Pattern : Symbol { space = 1, number, identifier, quoted, punctuation };

  auto automaton() -> parsing::DFA const& {
    static auto const res = [] {
      auto b = AutomatonBuilder();
      auto const digits = [&] { return b.plus(b.range('0', '9')); };
      auto const letter = [&] { return b.alt({b.range('a', 'z'), b.range('A', 'Z'), b.chars({'_'})}); };
      b.pattern(space, b.plus(b.chars({' ', '\t', '\r', '\n'})));
      b.pattern(
        number,
        b.concat(
          {digits(),
           b.opt(b.concat({b.chars({'.'}), digits()})),
           b.opt(b.concat({b.chars({'e', 'E'}), b.opt(b.chars({'+', '-'})), digits()}))}
        )
      );
      b.pattern(identifier, b.concat({letter(), b.star(b.alt({letter(), b.range('0', '9')}))}));
      b.pattern(quoted, b.concat({b.chars({'"'}), b.plus(b.except({'"'})), b.chars({'"'})}));
      b.pattern(punctuation, b.chars({'+', '-', '*', '/', '%', '^', '(', ')', ','}));
      return b.makeDFA();
    }();
    return res;
  }

  struct FunctionInfo {
    std::string_view name;
    size_t minArgs;
    size_t maxArgs;
  };

  constexpr auto functions = std::array<FunctionInfo, 10>{
    FunctionInfo{ "sqrt", 1,                                   1},
    FunctionInfo{  "abs", 1,                                   1},
    FunctionInfo{  "min", 1, std::numeric_limits<size_t>::max()},
    FunctionInfo{  "max", 1, std::numeric_limits<size_t>::max()},
    FunctionInfo{  "pow", 2,                                   2},
    FunctionInfo{  "log", 1,                                   2},
    FunctionInfo{  "exp", 1,                                   1},
    FunctionInfo{"floor", 1,                                   1},
    FunctionInfo{ "ceil", 1,                                   1},
    FunctionInfo{"round", 1,                                   1},
  };

  // Binding strength of binary operators; 0 for non-operators.
  auto binaryPrecedence(char op) -> Precedence {
    switch (op) {
      case '+':
      case '-':
        return 1;
      case '*':
      case '/':
      case '%':
        return 2;
      case '^':
        return 4;
      default:
        return 0;
    }
  }
  constexpr Precedence prefixPrecedence = 3;
  constexpr size_t maxNesting = 256;

  // Precedence climbing over a token list.
  // See: https://en.wikipedia.org/wiki/Operator-precedence_parser#Precedence_climbing_method
  class Parser {
  public:
    Parser(std::vector<Token> tokens, size_t length, Allocator<Expr>& pool, std::vector<std::string>& refs):
        _tokens(std::move(tokens)),
        _length(length),
        _pool(pool),
        _refs(refs) {}

    auto operator()() -> Expr const* {
      auto const res = _expression(1);
      if (_pos < _tokens.size())
        throw ParseError("unexpected \"" + _tokens[_pos].lexeme + "\"", _tokens[_pos].begin);
      return res;
    }

  private:
    std::vector<Token> _tokens;
    size_t _length;
    size_t _pos = 0;
    size_t _nesting = 0;
    Allocator<Expr>& _pool;
    std::vector<std::string>& _refs;

    auto _peek() const -> Token const* {
      return _pos < _tokens.size() ? &_tokens[_pos] : nullptr;
    }
    auto _isPunct(char c) const -> bool {
      auto const t = _peek();
      return t && t->id == punctuation && t->lexeme[0] == c;
    }
    auto _expect(char c) -> void {
      if (!_isPunct(c)) {
        auto const at = _peek() ? _peek()->begin : _length;
        throw ParseError(std::string("expected \"") + c + "\"", at);
      }
      _pos++;
    }

    auto _expression(Precedence min) -> Expr const* {
      if (++_nesting > maxNesting)
        throw ParseError("expression is nested too deeply", _peek() ? _peek()->begin : _length);
      auto lhs = _prefix();
      while (auto const t = _peek()) {
        if (t->id != punctuation)
          throw ParseError("expected an operator before \"" + t->lexeme + "\"", t->begin);
        auto const op = t->lexeme[0];
        auto const prec = binaryPrecedence(op);
        if (prec == 0 || prec < min)
          break;
        _pos++;
        // `^` is right-associative.
        auto const rhs = _expression(op == '^' ? prec : prec + 1);
        lhs = _pool.make(Binary{op, lhs, rhs});
      }
      _nesting--;
      return lhs;
    }

    auto _prefix() -> Expr const* {
      auto const t = _peek();
      if (!t)
        throw ParseError("unexpected end of expression", _length);
      _pos++;
      if (!t->id)
        throw ParseError("unexpected \"" + t->lexeme + "\"", t->begin);
      switch (*t->id) {
        case number: {
          auto val = 0.0;
          auto const [ptr, ec] = std::from_chars(t->lexeme.data(), t->lexeme.data() + t->lexeme.size(), val);
          if (ec != std::errc() || ptr != t->lexeme.data() + t->lexeme.size())
            throw ParseError("number \"" + t->lexeme + "\" is out of range", t->begin);
          return _pool.make(Number{val});
        }
        case quoted:
          return _reference(t->lexeme.substr(1, t->lexeme.size() - 2));
        case identifier:
          if (_isPunct('('))
            return _call(*t);
          return _reference(t->lexeme);
        case punctuation:
          if (t->lexeme[0] == '-')
            return _pool.make(Negate{_expression(prefixPrecedence)});
          if (t->lexeme[0] == '+')
            return _expression(prefixPrecedence);
          if (t->lexeme[0] == '(') {
            auto const res = _expression(1);
            _expect(')');
            return res;
          }
          throw ParseError("unexpected \"" + t->lexeme + "\"", t->begin);
        default:
          unreachable;
      }
    }

    auto _reference(std::string name) -> Expr const* {
      if (std::ranges::find(_refs, name) == _refs.end())
        _refs.push_back(name);
      return _pool.make(Reference{std::move(name)});
    }

    auto _call(Token const& name) -> Expr const* {
      auto const it = std::ranges::find(functions, std::string_view(name.lexeme), &FunctionInfo::name);
      if (it == functions.end())
        throw ParseError("unknown function \"" + name.lexeme + "\"", name.begin);
      _expect('(');
      auto args = std::vector<Expr const*>();
      if (!_isPunct(')')) {
        args.push_back(_expression(1));
        while (_isPunct(',')) {
          _pos++;
          args.push_back(_expression(1));
        }
      }
      _expect(')');
      if (args.size() < it->minArgs || args.size() > it->maxArgs)
        throw ParseError("wrong number of arguments to \"" + name.lexeme + "\"", name.begin);
      return _pool.make(Call{name.lexeme, std::move(args)});
    }
  };

  auto Expression::parse(std::string source) -> Expression {
    auto res = Expression();
    auto tokens = parsing::tokenize(automaton(), source);
    std::erase_if(tokens, [](Token const& t) { return t.id == space; });
    res._root = Parser(std::move(tokens), source.size(), res._pool, res._references)();
    res._source = std::move(source);
    return res;
  }

  auto finite(double x) -> double {
    if (!std::isfinite(x))
      throw EvalError("result is not a finite number");
    return x;
  }

  auto eval(Expr const& e, std::function<std::optional<double>(std::string const&)> const& lookup) -> double {
    return match(
      e,
      [&](Number const& n) { return n.val; },
      [&](Reference const& r) {
        auto const v = lookup(r.name);
        if (!v)
          throw EvalError("unresolved reference \"" + r.name + "\"");
        return *v;
      },
      [&](Negate const& n) { return -eval(*n.operand, lookup); },
      [&](Binary const& b) {
        auto const l = eval(*b.lhs, lookup), r = eval(*b.rhs, lookup);
        switch (b.op) {
          case '+': return finite(l + r);
          case '-': return finite(l - r);
          case '*': return finite(l * r);
          case '/':
            if (r == 0.0)
              throw EvalError("division by zero");
            return finite(l / r);
          case '%':
            if (r == 0.0)
              throw EvalError("division by zero");
            return finite(std::fmod(l, r));
          case '^': return finite(std::pow(l, r));
          default: unreachable;
        }
      },
      [&](Call const& c) {
        auto args = std::vector<double>();
        for (auto const arg: c.args)
          args.push_back(eval(*arg, lookup));
        auto const& f = c.func;
        if (f == "sqrt") return finite(std::sqrt(args[0]));
        if (f == "abs") return std::abs(args[0]);
        if (f == "min") return std::ranges::min(args);
        if (f == "max") return std::ranges::max(args);
        if (f == "pow") return finite(std::pow(args[0], args[1]));
        if (f == "log") return finite(args.size() == 2 ? std::log(args[0]) / std::log(args[1]) : std::log(args[0]));
        if (f == "exp") return finite(std::exp(args[0]));
        if (f == "floor") return std::floor(args[0]);
        if (f == "ceil") return std::ceil(args[0]);
        if (f == "round") return std::round(args[0]);
        unreachable;
      }
    );
  }

  auto Expression::evaluate(std::function<std::optional<double>(std::string const&)> const& lookup) const -> double {
    assert(_root != nullptr);
    return finite(eval(*_root, lookup));
  }

#include "macros_close.hpp"
}

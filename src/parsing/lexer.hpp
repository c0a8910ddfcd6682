#ifndef NODEBOOK_PARSING_LEXER_HPP
#define NODEBOOK_PARSING_LEXER_HPP

#include <array>
#include <vector>
#include "stream.hpp"

namespace nodebook::parsing {
#include "macros_open.hpp"

  // Nondeterministic automaton. Edges labelled 0 are ε-edges.
  struct NFA {
    struct State {
      std::vector<std::pair<Char, size_t>> edges;
      std::optional<Symbol> accepts;
    };
    std::vector<State> states;
    size_t start = 0;
  };

  // Deterministic automaton over bytes.
  class DFA {
  public:
    struct State {
      std::array<std::optional<size_t>, CharMax + 1> next;
      std::optional<Symbol> accepts;
    };
    std::vector<State> states;
    size_t start = 0;

    // Longest-prefix match. On success, returns the symbol and leaves `stream` after the matched prefix.
    // On failure, leaves `stream` where it was.
    auto match(IStream<Char>& stream) const -> std::optional<Symbol>;
  };

  // Thompson-style construction of a lexer automaton from regular expressions.
  // Every combinator consumes its arguments: a fragment cannot be used twice.
  class AutomatonBuilder {
  public:
    // Entry and exit state of a fragment.
    using Fragment = std::pair<size_t, size_t>;

    AutomatonBuilder() { _nfa.start = _state(); }

    auto any() -> Fragment;
    auto chars(std::vector<Char> const& ls) -> Fragment;
    auto except(std::vector<Char> const& ls) -> Fragment;
    auto range(Char a, Char b) -> Fragment;
    auto word(std::string_view s) -> Fragment;
    auto alt(std::vector<Fragment> const& ls) -> Fragment;
    auto concat(std::vector<Fragment> const& ls) -> Fragment;
    auto opt(Fragment a) -> Fragment;
    auto star(Fragment a) -> Fragment;
    auto plus(Fragment a) -> Fragment;

    // When two patterns match the same length, the larger symbol wins.
    auto pattern(Symbol sym, Fragment a) -> AutomatonBuilder&;

    auto makeDFA() const -> DFA;

  private:
    NFA _nfa;

    auto _state() -> size_t;
    auto _edge(size_t s, Char c, size_t t) -> void;
    auto _charset(std::array<bool, CharMax + 1> const& set) -> Fragment;
  };

  struct Token {
    std::optional<Symbol> id; // Empty for unrecognised text.
    std::string lexeme;
    size_t begin;
    size_t end;
  };

  // Splits a stream into tokens.
  // Text that no pattern matches is grouped into one token per run.
  class AutomatonLexer {
  public:
    AutomatonLexer(DFA const& automaton, CharStream& stream):
        _automaton(automaton),
        _stream(stream) {}

    auto next() -> std::optional<Token>;

  private:
    DFA const& _automaton;
    CharStream& _stream;
  };

  auto tokenize(DFA const& automaton, std::string_view s) -> std::vector<Token>;

#include "macros_close.hpp"
}

#endif // NODEBOOK_PARSING_LEXER_HPP

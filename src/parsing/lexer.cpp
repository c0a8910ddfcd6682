#include "lexer.hpp"
#include <algorithm>
#include <map>

namespace nodebook::parsing {
#include "macros_open.hpp"

  namespace {

    // States reachable from `set` through ε-edges, including `set` itself. Sorted.
    auto closure(NFA const& nfa, std::vector<size_t> set) -> std::vector<size_t> {
      auto seen = std::vector<bool>(nfa.states.size(), false);
      for (auto const x: set)
        seen[x] = true;
      for (auto i = 0uz; i < set.size(); i++)
        for (auto const& [c, t]: nfa.states[set[i]].edges)
          if (c == 0 && !seen[t]) {
            seen[t] = true;
            set.push_back(t);
          }
      std::ranges::sort(set);
      return set;
    }

    // Subset construction, breadth-first over reachable state sets.
    // See: https://en.wikipedia.org/wiki/Powerset_construction
    auto determinise(NFA const& nfa) -> DFA {
      auto res = DFA();
      auto ids = std::map<std::vector<size_t>, size_t>();
      auto sets = std::vector<std::vector<size_t>>();
      auto const add = [&](std::vector<size_t> set) {
        auto const [it, inserted] = ids.try_emplace(std::move(set), sets.size());
        if (inserted) {
          sets.push_back(it->first);
          res.states.emplace_back();
        }
        return it->second;
      };

      res.start = add(closure(nfa, {nfa.start}));
      for (auto i = 0uz; i < sets.size(); i++) {
        auto targets = std::array<std::vector<size_t>, CharMax + 1>();
        auto accepts = std::optional<Symbol>();
        for (auto const x: sets[i]) {
          auto const& state = nfa.states[x];
          accepts = std::max(accepts, state.accepts);
          for (auto const& [c, t]: state.edges)
            if (c != 0)
              targets[c].push_back(t);
        }
        res.states[i].accepts = accepts;
        for (auto c = 1uz; c <= CharMax; c++)
          if (!targets[c].empty()) {
            auto const j = add(closure(nfa, std::move(targets[c])));
            res.states[i].next[c] = j;
          }
      }
      return res;
    }

    // Advances past one UTF-8 encoded code point. Returns false at the end of input.
    auto skipCodePoint(IStream<Char>& stream) -> bool {
      if (!stream.advance())
        return false;
      auto pos = stream.position();
      for (auto c = stream.advance(); c && (*c & 0xC0) == 0x80; c = stream.advance()) // NOLINT(cppcoreguidelines-avoid-magic-numbers)
        pos = stream.position();
      stream.revert(pos);
      return true;
    }

  }

  auto DFA::match(IStream<Char>& stream) const -> std::optional<Symbol> {
    auto res = std::optional<Symbol>();
    auto end = stream.position();
    for (auto s = start; auto const c = stream.advance();) {
      auto const t = states[s].next[*c];
      if (!t)
        break;
      s = *t;
      if (states[s].accepts) {
        res = states[s].accepts;
        end = stream.position();
      }
    }
    stream.revert(end);
    return res;
  }

  auto AutomatonBuilder::_state() -> size_t {
    _nfa.states.emplace_back();
    return _nfa.states.size() - 1;
  }

  auto AutomatonBuilder::_edge(size_t s, Char c, size_t t) -> void {
    _nfa.states[s].edges.emplace_back(c, t);
  }

  auto AutomatonBuilder::_charset(std::array<bool, CharMax + 1> const& set) -> Fragment {
    auto const s = _state(), t = _state();
    // Byte 0 labels ε-edges, so it can never be matched.
    for (auto c = 1uz; c <= CharMax; c++)
      if (set[c])
        _edge(s, static_cast<Char>(c), t);
    return {s, t};
  }

  auto AutomatonBuilder::any() -> Fragment {
    auto set = std::array<bool, CharMax + 1>();
    set.fill(true);
    return _charset(set);
  }

  auto AutomatonBuilder::chars(std::vector<Char> const& ls) -> Fragment {
    auto set = std::array<bool, CharMax + 1>{};
    for (auto const c: ls)
      set[c] = true;
    return _charset(set);
  }

  auto AutomatonBuilder::except(std::vector<Char> const& ls) -> Fragment {
    auto set = std::array<bool, CharMax + 1>();
    set.fill(true);
    for (auto const c: ls)
      set[c] = false;
    return _charset(set);
  }

  auto AutomatonBuilder::range(Char a, Char b) -> Fragment {
    auto set = std::array<bool, CharMax + 1>{};
    for (auto c = size_t{a}; c <= b; c++)
      set[c] = true;
    return _charset(set);
  }

  auto AutomatonBuilder::word(std::string_view s) -> Fragment {
    auto const first = _state();
    auto last = first;
    for (auto const c: s) {
      auto const t = _state();
      _edge(last, static_cast<Char>(c), t);
      last = t;
    }
    return {first, last};
  }

  auto AutomatonBuilder::alt(std::vector<Fragment> const& ls) -> Fragment {
    auto const s = _state(), t = _state();
    for (auto const& [entry, exit]: ls) {
      _edge(s, 0, entry);
      _edge(exit, 0, t);
    }
    return {s, t};
  }

  auto AutomatonBuilder::concat(std::vector<Fragment> const& ls) -> Fragment {
    assert(!ls.empty());
    for (auto i = 1uz; i < ls.size(); i++)
      _edge(ls[i - 1].second, 0, ls[i].first);
    return {ls.front().first, ls.back().second};
  }

  auto AutomatonBuilder::opt(Fragment a) -> Fragment {
    _edge(a.first, 0, a.second);
    return a;
  }

  auto AutomatonBuilder::star(Fragment a) -> Fragment {
    auto const s = _state(), t = _state();
    _edge(s, 0, a.first);
    _edge(s, 0, t);
    _edge(a.second, 0, a.first);
    _edge(a.second, 0, t);
    return {s, t};
  }

  auto AutomatonBuilder::plus(Fragment a) -> Fragment {
    auto const t = _state();
    _edge(a.second, 0, a.first);
    _edge(a.second, 0, t);
    return {a.first, t};
  }

  auto AutomatonBuilder::pattern(Symbol sym, Fragment a) -> AutomatonBuilder& {
    _edge(_nfa.start, 0, a.first);
    _nfa.states[a.second].accepts = sym;
    return *this;
  }

  auto AutomatonBuilder::makeDFA() const -> DFA {
    return determinise(_nfa);
  }

  auto AutomatonLexer::next() -> std::optional<Token> {
    auto const begin = _stream.position();
    if (auto const id = _automaton.match(_stream))
      return Token{id, std::string(_stream.slice(begin, _stream.position())), begin, _stream.position()};
    if (!skipCodePoint(_stream))
      return {};
    // Unrecognised: extend up to the next position where some pattern matches.
    auto end = _stream.position();
    while (!_automaton.match(_stream) && skipCodePoint(_stream))
      end = _stream.position();
    _stream.revert(end);
    return Token{{}, std::string(_stream.slice(begin, end)), begin, end};
  }

  auto tokenize(DFA const& automaton, std::string_view s) -> std::vector<Token> {
    auto stream = CharStream(std::string(s));
    auto lexer = AutomatonLexer(automaton, stream);
    auto res = std::vector<Token>();
    while (auto token = lexer.next())
      res.push_back(std::move(*token));
    return res;
  }

#include "macros_close.hpp"
}

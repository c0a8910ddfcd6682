#include "lines.hpp"

namespace nodebook::cnl {
#include "macros_open.hpp"

  using parsing::AutomatonBuilder, parsing::Symbol;

  // Pattern IDs. On equal match lengths, larger IDs win.
  enum Pattern : Symbol { whitespace = 1, stray, unit, adjective, quantifier, modality, literal };

  LineClassifier::LineClassifier() {
    auto b = AutomatonBuilder();
    b.pattern(whitespace, b.plus(b.chars({' ', '\t'})));
    b.pattern(stray, b.alt({b.word("**"), b.word("++"), b.chars({'*', '[', ']'})}));
    b.pattern(unit, b.concat({b.chars({'*'}), b.plus(b.except({'*'})), b.chars({'*'})}));
    b.pattern(adjective, b.concat({b.word("**"), b.plus(b.except({'*'})), b.word("**")}));
    b.pattern(quantifier, b.concat({b.word("++"), b.plus(b.except({'+'})), b.word("++")}));
    b.pattern(modality, b.concat({b.chars({'['}), b.plus(b.except({'[', ']'})), b.chars({']'})}));
    b.pattern(literal, b.concat({b.chars({'"'}), b.star(b.except({'"'})), b.chars({'"'})}));
    _automaton = b.makeDFA();
  }

  auto classifier() -> LineClassifier const& {
    static auto const instance = LineClassifier();
    return instance;
  }

  auto trim(std::string_view s) -> std::string_view {
    auto const first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos)
      return {};
    auto const last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
  }

  // Removes one trailing `;`.
  auto stripSemicolon(std::string_view s) -> std::string_view {
    s = trim(s);
    if (s.ends_with(';'))
      s.remove_suffix(1);
    return trim(s);
  }

  auto unquote(std::string_view s) -> std::string_view {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"')
      return s.substr(1, s.size() - 2);
    return s;
  }

  auto LineClassifier::scan(std::string_view segment) const -> Segment {
    auto res = Segment();
    auto text = std::string();
    auto pendingSpace = false;
    auto const set = [](std::optional<std::string>& field, std::string_view what, std::string_view lexeme, size_t n) {
      if (field)
        throw SyntaxError("repeated " + std::string(what) + " modifier");
      auto const content = trim(lexeme.substr(n, lexeme.size() - 2 * n));
      if (content.empty())
        throw SyntaxError("empty " + std::string(what) + " modifier");
      field = std::string(content);
    };
    for (auto const& token: parsing::tokenize(_automaton, segment)) {
      if (!token.id || *token.id == literal) {
        if (pendingSpace && !text.empty())
          text += ' ';
        text += token.lexeme;
        pendingSpace = false;
        continue;
      }
      switch (*token.id) {
        case whitespace:
          pendingSpace = true;
          break;
        case stray:
          throw SyntaxError("malformed modifier token \"" + token.lexeme + "\"");
        case unit:
          set(res.unit, "unit", token.lexeme, 1);
          pendingSpace = true;
          break;
        case adjective:
          set(res.adjective, "adjective", token.lexeme, 2);
          pendingSpace = true;
          break;
        case quantifier:
          set(res.quantifier, "quantifier", token.lexeme, 2);
          pendingSpace = true;
          break;
        case modality:
          set(res.modality, "modality", token.lexeme, 1);
          pendingSpace = true;
          break;
        default:
          unreachable;
      }
    }
    res.text = std::move(text);
    return res;
  }

  auto LineClassifier::classify(std::string_view source) const -> std::vector<Line> {
    auto res = std::vector<Line>();
    auto inFence = false;
    auto number = 0uz;
    auto pos = 0uz;
    while (pos <= source.size()) {
      auto end = source.find('\n', pos);
      if (end == std::string_view::npos)
        end = source.size();
      auto line = source.substr(pos, end - pos);
      if (line.ends_with('\r'))
        line.remove_suffix(1);
      number++;
      if (inFence) {
        if (trim(line) == "```") {
          res.push_back({number, FenceClose{}});
          inFence = false;
        } else {
          res.push_back({number, VerbatimLine{std::string(line)}});
        }
      } else {
        auto content = classifyLine(line);
        inFence = std::holds_alternative<FenceOpen>(content);
        res.push_back({number, std::move(content)});
      }
      pos = end + 1;
    }
    return res;
  }

  auto LineClassifier::classifyLine(std::string_view line) const -> LineContent {
    auto const s = trim(line);
    if (s.empty())
      return BlankLine{};
    if (s.starts_with("```")) {
      auto const info = trim(s.substr(3));
      if (info == "description")
        return FenceOpen{FenceKind::description};
      if (info == "graph-description")
        return FenceOpen{FenceKind::graphDescription};
      if (info.empty())
        return InvalidLine{"code fence closed without being opened"};
      return InvalidLine{"unknown code fence \"" + std::string(info) + "\""};
    }
    if (s.starts_with('#'))
      return _heading(s);
    if (s.starts_with('<'))
      return _relation(s);
    if (s.starts_with("++")) {
      auto const close = s.find("++", 2);
      if (close != std::string_view::npos && trim(s.substr(close + 2)).starts_with('<'))
        return _relation(s);
    }
    if (s.starts_with("has") && (s.size() == 3 || s[3] == ' ' || s[3] == '\t'))
      return _attribute(s);
    return InvalidLine{"unrecognised line \"" + std::string(s) + "\""};
  }

  auto LineClassifier::_heading(std::string_view s) const -> LineContent {
    auto const level = s.find_first_not_of('#');
    auto const rest = level == std::string_view::npos ? std::string_view() : trim(s.substr(level));
    if (rest.empty())
      return InvalidLine{"heading has no name", true};
    try {
      auto seg = scan(rest);
      if (seg.text.empty())
        return InvalidLine{"heading has no name", true};
      if (level > 1) {
        if (seg.adjective || seg.quantifier || seg.unit || seg.modality)
          return InvalidLine{"modifiers are not allowed in a morph heading", true};
        return MorphHeading{std::move(seg.text)};
      }
      if (seg.unit)
        return InvalidLine{"unit modifier is not allowed in a node heading", true};
      auto types = std::vector<std::string>();
      if (seg.modality) {
        auto const& list = *seg.modality;
        auto start = 0uz;
        while (start <= list.size()) {
          auto end = list.find_first_of(";,", start);
          if (end == std::string::npos)
            end = list.size();
          auto const type = trim(std::string_view(list).substr(start, end - start));
          if (!type.empty())
            types.emplace_back(type);
          start = end + 1;
        }
      }
      return NodeHeading{std::move(seg.text), std::move(seg.adjective), std::move(seg.quantifier), std::move(types)};
    } catch (SyntaxError& e) {
      return InvalidLine{e.what(), true};
    }
  }

  auto LineClassifier::_relation(std::string_view s) const -> LineContent {
    s = stripSemicolon(s);
    auto adverb = std::optional<std::string>();
    if (s.starts_with("++")) {
      auto const close = s.find("++", 2);
      auto const content = trim(s.substr(2, close - 2));
      if (content.empty())
        return InvalidLine{"empty quantifier modifier"};
      adverb = std::string(content);
      s = trim(s.substr(close + 2));
    }
    auto const close = s.find('>');
    if (close == std::string_view::npos)
      return InvalidLine{"relation name is missing its closing \">\""};
    auto const name = trim(s.substr(1, close - 1));
    if (name.empty())
      return InvalidLine{"relation name is empty"};
    try {
      auto seg = scan(s.substr(close + 1));
      if (seg.text.empty())
        return InvalidLine{"relation \"" + std::string(name) + "\" has no target"};
      if (seg.unit)
        return InvalidLine{"unit modifier is not allowed in a relation"};
      if (seg.quantifier) {
        if (adverb)
          return InvalidLine{"repeated quantifier modifier"};
        adverb = std::move(seg.quantifier);
      }
      return RelationLine{std::string(name), std::move(seg.text), std::move(adverb), std::move(seg.adjective), std::move(seg.modality)};
    } catch (SyntaxError& e) {
      return InvalidLine{e.what()};
    }
  }

  auto LineClassifier::_attribute(std::string_view s) const -> LineContent {
    s = stripSemicolon(trim(s.substr(3)));
    if (s.starts_with("function") && (s.size() == 8 || s[8] == ' ' || s[8] == '\t' || s[8] == '"')) {
      auto const rest = trim(s.substr(8));
      if (!rest.starts_with(':')) {
        auto const name = trim(unquote(rest));
        if (name.empty())
          return InvalidLine{"function application has no name"};
        return FunctionLine{std::string(name)};
      }
    }
    auto const colon = s.find(':');
    if (colon == std::string_view::npos)
      return InvalidLine{"attribute is missing \":\" between name and value"};
    auto const name = trim(s.substr(0, colon));
    if (name.empty())
      return InvalidLine{"attribute name is empty"};
    try {
      auto seg = scan(s.substr(colon + 1));
      if (seg.text.empty())
        return InvalidLine{"attribute \"" + std::string(name) + "\" has no value"};
      if (seg.adjective)
        return InvalidLine{"adjective modifier is not allowed in an attribute"};
      return AttributeLine{std::string(name), std::move(seg.text), std::move(seg.quantifier), std::move(seg.unit), std::move(seg.modality)};
    } catch (SyntaxError& e) {
      return InvalidLine{e.what()};
    }
  }

#include "macros_close.hpp"
}

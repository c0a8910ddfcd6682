#include "parser.hpp"
#include <graph/graph.hpp>

namespace nodebook::cnl {
#include "macros_open.hpp"

  auto quoted(std::string const& s) -> std::string {
    return "\"" + s + "\"";
  }

  auto BlockParser::parse(std::vector<Line> const& lines) -> Document {
    _document = {};
    _index.clear();
    _current.reset();
    _morph = graph::defaultMorphName;
    _orphaned = false;
    _capture.reset();

    for (auto const& l: lines) {
      auto const line = l.number;
      match(
        l.content,
        [&](BlankLine const&) {},
        [&](NodeHeading const& h) { _heading(line, h); },
        [&](MorphHeading const& h) { _morphHeading(line, h); },
        [&](RelationLine const& r) {
          if (auto const node = _owner(line, "relation " + quoted(r.name)))
            node->relations.push_back({line, _morph, r.name, r.target, r.adverb, r.adjective, r.modality});
        },
        [&](AttributeLine const& a) {
          if (auto const node = _owner(line, "attribute " + quoted(a.name)))
            node->attributes.push_back({line, _morph, a.name, a.value, a.quantifier, a.unit, a.modality});
        },
        [&](FunctionLine const& f) {
          if (auto const node = _owner(line, "function " + quoted(f.name)))
            node->functions.push_back({line, _morph, f.name});
        },
        [&](FenceOpen const& f) {
          auto discard = false;
          if (f.kind == FenceKind::description && !_current) {
            if (!_orphaned)
              _reporter.error(line, ErrorKind::structural, "description declared before any node");
            discard = true;
          }
          _capture = Capture{f.kind, line, {}, discard};
        },
        [&](FenceClose const&) { _close(); },
        [&](VerbatimLine const& v) {
          assert(_capture.has_value());
          _capture->text.push_back(v.text);
        },
        [&](InvalidLine const& e) {
          _reporter.error(line, ErrorKind::syntax, e.message);
          if (e.heading) {
            _current.reset();
            _orphaned = true;
          }
        }
      );
    }

    if (_capture)
      _reporter.error(_capture->line, ErrorKind::syntax, "code fence is never closed");
    return std::move(_document);
  }

  auto BlockParser::_heading(size_t line, NodeHeading const& h) -> void {
    auto const id = graph::nodeId(h.name);
    _morph = graph::defaultMorphName;
    _orphaned = false;
    auto const it = _index.find(id);
    if (it == _index.end()) {
      _index.emplace(id, _document.nodes.size());
      _current = _document.nodes.size();
      _document.nodes.push_back({line, h.name, h.adjective, h.quantifier, h.types, {}, {}, {}, {}, {}});
      return;
    }

    // Continuation of an earlier block.
    _current = it->second;
    auto& node = _document.nodes[it->second];
    auto const conflict = [&](std::string const& field, std::string const& was, std::string const& now) {
      _reporter.error(
        line,
        ErrorKind::identityConflict,
        "node " + quoted(h.name) + " is redeclared with " + field + " " + quoted(now) + " (was " + quoted(was)
          + " at line " + std::to_string(node.line) + ")"
      );
    };
    if (node.baseName != h.name)
      conflict("name", node.baseName, h.name);
    if (h.adjective) {
      if (!node.adjective)
        node.adjective = h.adjective;
      else if (*node.adjective != *h.adjective)
        conflict("adjective", *node.adjective, *h.adjective);
    }
    if (h.quantifier) {
      if (!node.quantifier)
        node.quantifier = h.quantifier;
      else if (*node.quantifier != *h.quantifier)
        conflict("quantifier", *node.quantifier, *h.quantifier);
    }
    if (!h.types.empty()) {
      if (node.types.empty())
        node.types = h.types;
      else if (node.types != h.types)
        conflict("types", node.types.front(), h.types.front());
    }
  }

  auto BlockParser::_morphHeading(size_t line, MorphHeading const& h) -> void {
    if (!_current) {
      if (!_orphaned)
        _reporter.error(line, ErrorKind::structural, "morph " + quoted(h.name) + " declared before any node");
      return;
    }
    _morph = h.name;
    auto& node = _document.nodes[*_current];
    for (auto const& m: node.morphs)
      if (m.name == h.name)
        return;
    if (h.name != graph::defaultMorphName)
      node.morphs.push_back({line, h.name});
  }

  // Returns the node that receives a child declaration, or reports why there is none.
  auto BlockParser::_owner(size_t line, std::string const& what) -> NodeDecl* {
    if (_current)
      return &_document.nodes[*_current];
    if (_orphaned)
      _reporter.skip(line, what + " under an invalid heading");
    else
      _reporter.error(line, ErrorKind::structural, what + " declared before any node");
    return nullptr;
  }

  auto BlockParser::_close() -> void {
    assert(_capture.has_value());
    auto text = std::string();
    for (auto i = 0uz; i < _capture->text.size(); i++) {
      if (i > 0)
        text += '\n';
      text += _capture->text[i];
    }
    if (_capture->kind == FenceKind::graphDescription) {
      _document.description = std::move(text);
    } else if (!_capture->discard) {
      auto& node = _document.nodes[*_current];
      if (node.description && *node.description != text)
        _reporter.error(
          _capture->line,
          ErrorKind::identityConflict,
          "node " + quoted(node.baseName) + " has more than one description"
        );
      else
        node.description = std::move(text);
    }
    _capture.reset();
  }

  auto parse(std::string_view source, Reporter& reporter) -> Document {
    auto parser = BlockParser(reporter);
    return parser.parse(classifier().classify(source));
  }

#include "macros_close.hpp"
}

#include "evaluator.hpp"
#include <algorithm>

namespace nodebook::compiler {
#include "macros_open.hpp"

  using cnl::ErrorKind;
  using graph::MorphId;

  namespace {

    // All literal values a name denotes within one morph.
    struct LiteralDep {
      std::string reference;
      MorphId scope;
      std::vector<ResolvedAttribute const*> values;
    };
    using Dep = std::variant<LiteralDep, size_t>;

    auto contains(std::vector<MorphId> const& morphs, MorphId const& m) -> bool {
      return std::ranges::find(morphs, m) != morphs.end();
    }

    class Evaluator {
    public:
      Evaluator(ResolvedGraph const& resolved, graph::Graph const& prior, cnl::Reporter& reporter):
          _resolved(resolved),
          _prior(prior),
          _reporter(reporter),
          _deps(resolved.functions.size()),
          _states(resolved.functions.size(), State::unvisited),
          _failed(resolved.functions.size(), false),
          _changed(resolved.functions.size(), false),
          _values(resolved.functions.size(), 0.0) {}

      auto operator()() -> Evaluation {
        for (auto i = 0uz; i < _resolved.functions.size(); i++)
          _deps[i] = _dependencies(_resolved.functions[i]);
        for (auto i = 0uz; i < _resolved.functions.size(); i++)
          _visit(i);
        auto res = Evaluation();
        for (auto const i: _order)
          _evaluate(i, res);
        return res;
      }

    private:
      enum class State : uint32_t { unvisited, visiting, done };

      ResolvedGraph const& _resolved;
      graph::Graph const& _prior;
      cnl::Reporter& _reporter;
      std::vector<std::vector<Dep>> _deps;
      std::vector<State> _states;
      std::vector<bool> _failed;
      std::vector<bool> _changed;
      std::vector<double> _values;
      std::vector<size_t> _stack;
      std::vector<size_t> _order; // Dependencies first.

      auto _nodeName(ResolvedFunction const& f) const -> std::string const& {
        return _resolved.nodes.at(f.nodeId).node.name;
      }

      // Looks in the function's morph, then in the default morph.
      // Within a morph, literal attributes shadow functions of the same name.
      auto _dependencies(ResolvedFunction const& f) const -> std::vector<Dep> {
        auto scopes = std::vector<MorphId>{f.morph};
        if (auto const basic = graph::morphId(f.nodeId, graph::defaultMorphName); basic != f.morph)
          scopes.push_back(basic);
        auto res = std::vector<Dep>();
        for (auto const& ref: f.expression->references()) {
          for (auto const& scope: scopes) {
            auto literal = LiteralDep{ref, scope, {}};
            for (auto const* as: {&_resolved.attributes, &_resolved.carried})
              for (auto const& a: *as)
                if (a.attribute.source == f.nodeId && contains(a.attribute.morphs, scope)
                    && referenceMatches(a.attribute.name, ref))
                  literal.values.push_back(&a);
            if (!literal.values.empty()) {
              res.emplace_back(std::move(literal));
              break;
            }
            auto const& fs = _resolved.functions;
            auto const it = std::ranges::find_if(fs, [&](ResolvedFunction const& g) {
              return g.nodeId == f.nodeId && g.morph == scope && referenceMatches(g.name, ref);
            });
            if (it != fs.end()) {
              res.emplace_back(static_cast<size_t>(it - fs.begin()));
              break;
            }
          }
        }
        return res;
      }

      // Depth-first topological sort.
      auto _visit(size_t i) -> void {
        if (_states[i] == State::done)
          return;
        if (_states[i] == State::visiting) {
          _cycle(i);
          return;
        }
        _states[i] = State::visiting;
        _stack.push_back(i);
        for (auto const& dep: _deps[i])
          if (auto const j = std::get_if<size_t>(&dep))
            _visit(*j);
        _stack.pop_back();
        _states[i] = State::done;
        _order.push_back(i);
      }

      auto _cycle(size_t i) -> void {
        auto const it = std::ranges::find(_stack, i);
        auto const& f = _resolved.functions[i];
        auto path = std::string();
        for (auto j = it; j != _stack.end(); j++) {
          path += _resolved.functions[*j].name + " -> ";
          _failed[*j] = true;
        }
        path += f.name;
        _reporter.error(f.line, ErrorKind::circularDerivation, "circular derivation on \"" + _nodeName(f) + "\": " + path);
      }

      auto _priorValues(LiteralDep const& dep, std::string const& nodeId) const -> std::vector<std::string> {
        auto res = std::vector<std::string>();
        for (auto const& [_, a]: _prior.attributes)
          if (!a.derived && a.source == nodeId && contains(a.morphs, dep.scope) && referenceMatches(a.name, dep.reference))
            res.push_back(a.value);
        std::ranges::sort(res);
        return res;
      }

      auto _dirty(size_t i, graph::Attribute const* prior) const -> bool {
        auto const& f = _resolved.functions[i];
        if (!prior || !prior->derived || prior->expression != f.expression->source())
          return true;
        for (auto const& dep: _deps[i]) {
          auto const dirty = match(
            dep,
            [&](LiteralDep const& d) {
              auto current = std::vector<std::string>();
              for (auto const a: d.values)
                current.push_back(a->attribute.value);
              std::ranges::sort(current);
              return current != _priorValues(d, f.nodeId);
            },
            [&](size_t j) { return static_cast<bool>(_changed[j]); }
          );
          if (dirty)
            return true;
        }
        return false;
      }

      auto _lookup(size_t i, std::string const& name) const -> std::optional<double> {
        for (auto const& dep: _deps[i]) {
          auto const res = match(
            dep,
            [&](LiteralDep const& d) -> std::optional<double> {
              if (d.reference != name)
                return std::nullopt;
              if (d.values.size() != 1)
                throw expr::EvalError("\"" + name + "\" has " + std::to_string(d.values.size()) + " values");
              auto const x = schema::toNumber(d.values.front()->value);
              if (!x)
                throw expr::EvalError("\"" + name + "\" is not numeric");
              return x;
            },
            [&](size_t j) -> std::optional<double> {
              if (_resolved.functions[j].name != name && !referenceMatches(_resolved.functions[j].name, name))
                return std::nullopt;
              return _values[j];
            }
          );
          if (res)
            return res;
        }
        return std::nullopt;
      }

      auto _evaluate(size_t i, Evaluation& res) -> void {
        auto const& f = _resolved.functions[i];
        auto const what = "function \"" + f.name + "\"";
        auto const id = graph::derivedAttributeId(f.morph, f.name);
        if (_failed[i]) {
          _reporter.skip(f.line, what);
          res.failed.insert(id);
          return;
        }
        for (auto const& dep: _deps[i])
          if (auto const j = std::get_if<size_t>(&dep); j && _failed[*j]) {
            _failed[i] = true;
            _reporter.skip(f.line, what + " (depends on \"" + _resolved.functions[*j].name + "\")");
            res.failed.insert(id);
            return;
          }

        auto const it = _prior.attributes.find(id);
        auto const prior = it == _prior.attributes.end() ? nullptr : &it->second;

        auto value = std::optional<double>();
        if (!_dirty(i, prior))
          value = schema::parseFloat(prior->value);
        if (value) {
          _values[i] = *value;
        } else {
          try {
            _values[i] = f.expression->evaluate([&](std::string const& name) { return _lookup(i, name); });
          } catch (expr::EvalError& e) {
            _failed[i] = true;
            _reporter.error(f.line, ErrorKind::evaluationError, "cannot evaluate " + what + " of \"" + _nodeName(f) + "\": " + e.what());
            _reporter.skip(f.line, what);
            res.failed.insert(id);
            return;
          }
          res.recomputed.push_back(id);
        }

        auto a = graph::Attribute();
        a.id = id;
        a.source = f.nodeId;
        a.name = f.name;
        a.value = schema::formatNumber(_values[i]);
        a.derived = true;
        a.expression = f.expression->source();
        a.morphs.push_back(f.morph);
        _changed[i] = !prior || prior->value != a.value;
        res.derived.push_back(std::move(a));
      }
    };

  }

  auto evaluate(ResolvedGraph const& resolved, graph::Graph const& prior, cnl::Reporter& reporter) -> Evaluation {
    return Evaluator(resolved, prior, reporter)();
  }

#include "macros_close.hpp"
}

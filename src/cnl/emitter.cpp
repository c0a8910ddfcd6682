#include "emitter.hpp"
#include <sstream>

namespace nodebook::cnl {
#include "macros_open.hpp"

  auto fence(std::ostream& out, std::string_view kind, std::string const& text) -> void {
    out << "```" << kind << "\n" << text << "\n```\n";
  }

  auto heading(std::ostream& out, graph::Node const& n) -> void {
    out << "# ";
    if (n.quantifier)
      out << "++" << *n.quantifier << "++ ";
    if (n.adjective)
      out << "**" << *n.adjective << "** ";
    out << n.baseName;
    if (!n.types.empty()) {
      out << " [";
      for (auto i = 0uz; i < n.types.size(); i++)
        out << (i > 0 ? "; " : "") << n.types[i];
      out << "]";
    } else if (n.role != graph::defaultRole) {
      out << " [" << n.role << "]";
    }
    out << "\n";
  }

  auto relation(std::ostream& out, graph::Graph const& g, graph::Relation const& r) -> void {
    if (r.adverb)
      out << "++" << *r.adverb << "++ ";
    out << "<" << r.name << "> ";
    auto const it = g.nodes.find(r.target);
    out << (it != g.nodes.end() ? it->second.baseName : r.target);
    if (r.modality)
      out << " [" << *r.modality << "]";
    out << ";\n";
  }

  auto attribute(std::ostream& out, graph::Attribute const& a) -> void {
    if (a.derived) {
      out << "has function \"" << a.name << "\";\n";
      return;
    }
    out << "has " << a.name << ": ";
    if (a.quantifier)
      out << "++" << *a.quantifier << "++ ";
    out << a.value;
    if (a.unit)
      out << " *" << *a.unit << "*";
    if (a.modality)
      out << " [" << *a.modality << "]";
    out << ";\n";
  }

  auto emit(graph::Graph const& g) -> std::string {
    auto out = std::ostringstream();
    if (!g.description.empty()) {
      fence(out, "graph-description", g.description);
      out << "\n";
    }
    auto first = true;
    for (auto const& [id, n]: g.nodes) {
      if (!first)
        out << "\n";
      first = false;
      heading(out, n);
      if (!n.description.empty())
        fence(out, "description", n.description);
      auto const contents = g.morphContents(id);
      for (auto const& m: n.morphs) {
        if (m.name != graph::defaultMorphName)
          out << "\n## " << m.name << "\n";
        auto const it = contents.find(m.id);
        if (it == contents.end())
          continue;
        for (auto const r: it->second.relations)
          relation(out, g, *r);
        for (auto const a: it->second.attributes)
          attribute(out, *a);
      }
    }
    return out.str();
  }

#include "macros_close.hpp"
}

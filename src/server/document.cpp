#include "document.hpp"
#include <algorithm>

namespace nodebook::server {
#include "macros_open.hpp"

  namespace {

    struct Width {
      size_t bytes;
      uint32_t units; // UTF-16 code units.
    };

    // Malformed lead bytes count as one unit each.
    auto width(char lead) -> Width {
      auto const c = static_cast<uint8_t>(lead);
      if (c >= 0xF0)
        return {4, 2};
      if (c >= 0xE0)
        return {3, 1};
      if (c >= 0xC0)
        return {2, 1};
      return {1, 1};
    }

    auto utf16Length(std::string_view s) -> uint32_t {
      auto res = 0u;
      for (auto i = 0uz; i < s.size();) {
        auto const w = width(s[i]);
        i += w.bytes;
        res += w.units;
      }
      return res;
    }

  }

  auto Document::line(size_t i) const -> std::string_view {
    auto const begin = _starts.at(i);
    auto const end = i + 1 < _starts.size() ? _starts[i + 1] : _text.size();
    auto res = std::string_view(_text).substr(begin, end - begin);
    if (res.ends_with('\n'))
      res.remove_suffix(1);
    if (res.ends_with('\r'))
      res.remove_suffix(1);
    return res;
  }

  auto Document::offset(lsp::Position pos) const -> size_t {
    if (pos.line >= _starts.size())
      return _text.size();
    auto const s = line(pos.line);
    auto bytes = 0uz;
    for (auto units = 0u; bytes < s.size() && units < pos.character;) {
      auto const w = width(s[bytes]);
      bytes = std::min(bytes + w.bytes, s.size());
      units += w.units;
    }
    return _starts[pos.line] + bytes;
  }

  auto Document::position(size_t offset) const -> lsp::Position {
    offset = std::min(offset, _text.size());
    auto const i = static_cast<size_t>(std::ranges::upper_bound(_starts, offset) - _starts.begin()) - 1;
    auto const s = line(i);
    auto const column = std::min(offset - _starts[i], s.size());
    return {static_cast<uint32_t>(i), utf16Length(s.substr(0, column))};
  }

  auto Document::lineRange(size_t i) const -> lsp::Range {
    auto const n = static_cast<uint32_t>(i);
    return {
      {n,                    0},
      {n, utf16Length(line(i))}
    };
  }

  auto Document::apply(lsp::TextDocumentContentChangeEvent const& change) -> void {
    if (!change.range) {
      _text = change.text;
    } else {
      auto const start = offset(change.range->start);
      auto const end = std::max(start, offset(change.range->end));
      _text.replace(start, end - start, change.text);
    }
    _scanLines();
  }

  auto Document::_scanLines() -> void {
    _starts.assign(1, 0);
    for (auto i = 0uz; i < _text.size(); i++) {
      if (_text[i] == '\r' && i + 1 < _text.size() && _text[i + 1] == '\n')
        i++;
      if (_text[i] == '\n' || _text[i] == '\r')
        _starts.push_back(i + 1);
    }
  }

#include "macros_close.hpp"
}

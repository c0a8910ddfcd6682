#ifndef NODEBOOK_SERVER_DOCUMENT_HPP
#define NODEBOOK_SERVER_DOCUMENT_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <common.hpp>
#include "lsp.hpp"

namespace nodebook::server {
#include "macros_open.hpp"

  // The text of an open editor buffer, stored as UTF-8.
  // Positions exchanged with the client count UTF-16 code units; out-of-range positions are clamped.
  class Document {
  public:
    Document() = default;
    explicit Document(std::string text):
        _text(std::move(text)) {
      _scanLines();
    }

    auto text() const -> std::string const& { return _text; }
    auto lineCount() const -> size_t { return _starts.size(); }
    // Line `i`, without its line break.
    auto line(size_t i) const -> std::string_view;

    auto offset(lsp::Position pos) const -> size_t;
    auto position(size_t offset) const -> lsp::Position;
    // Covers all of line `i` except the line break.
    auto lineRange(size_t i) const -> lsp::Range;

    auto apply(lsp::TextDocumentContentChangeEvent const& change) -> void;

  private:
    std::string _text;
    std::vector<size_t> _starts = {0}; // Byte offset of each line. `\n`, `\r\n` and `\r` all end a line.

    auto _scanLines() -> void;
  };

#include "macros_close.hpp"
}

#endif // NODEBOOK_SERVER_DOCUMENT_HPP

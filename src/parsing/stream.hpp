#ifndef NODEBOOK_PARSING_STREAM_HPP
#define NODEBOOK_PARSING_STREAM_HPP

#include <string>
#include "basic.hpp"

namespace nodebook::parsing {
#include "macros_open.hpp"

  // Input that can be read forward one element at a time and rewound to an earlier position.
  template <typename T>
  class IStream {
    interface(IStream);
  public:
    // Empty at the end of input.
    virtual auto advance() -> std::optional<T> required;
    virtual auto position() const -> size_t required;
    // Requires `i <= position()`.
    virtual auto revert(size_t i) -> void required;
  };

  // Bytes of one CNL line, or of one function expression.
  class CharStream: public IStream<Char> {
  public:
    explicit CharStream(std::string s):
        _s(std::move(s)) {}

    auto advance() -> std::optional<Char> override {
      if (_pos >= _s.size())
        return {};
      return static_cast<Char>(_s[_pos++]);
    }
    auto position() const -> size_t override { return _pos; }
    auto revert(size_t i) -> void override {
      assert(i <= _pos);
      _pos = i;
    }

    auto str() const -> std::string_view { return _s; }
    // Requires `start <= end <= position()`.
    auto slice(size_t start, size_t end) const -> std::string_view {
      assert(start <= end && end <= _pos);
      return str().substr(start, end - start);
    }

  private:
    std::string _s;
    size_t _pos = 0;
  };

#include "macros_close.hpp"
}

#endif // NODEBOOK_PARSING_STREAM_HPP

#ifndef NODEBOOK_COMMON_HPP
#define NODEBOOK_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>
#include <variant>
#include <vector>
#undef assert

namespace nodebook {

  using std::int32_t;
  using std::int64_t;
  using std::size_t;
  using std::uint8_t;
  using std::uint32_t;
  using std::uint64_t;

  [[noreturn]] inline auto unreachable(char const* file, int line, char const* func) -> void {
    std::cerr << "Unreachable code reached at " << file << ":" << line << " (" << func << ")" << std::endl;
    std::terminate();
  }

  // Checked in release builds too.
  inline auto assert(bool expr, char const* name, char const* file, int line, char const* func) -> void {
    if (!expr) {
      std::cerr << "Assertion failed: " << name << std::endl;
      unreachable(file, line, func);
    }
  }

  template <typename... Ts>
  struct Matcher: Ts... {
    using Ts::operator()...;
  };

  // Visits a variant with one lambda per alternative, e.g. `match(v, [](Node const& n) {...}, [](Relation const& r) {...})`.
  // All lambdas must return the same type.
  // See: https://en.cppreference.com/w/cpp/utility/variant/visit
  template <typename T, typename... Ts>
  constexpr auto match(T&& variant, Ts&&... lambdas) {
    return std::visit(Matcher<Ts...>{std::forward<Ts>(lambdas)...}, std::forward<T>(variant));
  }

  // Arena for tree nodes: objects are allocated in fixed-size blocks and never move.
  // All objects are destroyed together with the arena.
  template <typename T>
  class Allocator {
  public:
    explicit Allocator(size_t blockSize):
        _blockSize(blockSize) {}
    ~Allocator() noexcept { _release(); }

    Allocator(Allocator const&) = delete;
    Allocator(Allocator&& r) noexcept:
        _blockSize(r._blockSize),
        _blocks(std::exchange(r._blocks, {})),
        _used(std::exchange(r._used, 0)) {}
    auto operator=(Allocator const&) -> Allocator& = delete;
    auto operator=(Allocator&& r) noexcept -> Allocator& {
      if (this != &r) {
        _release();
        _blockSize = r._blockSize;
        _blocks = std::exchange(r._blocks, {});
        _used = std::exchange(r._used, 0);
      }
      return *this;
    }

    template <typename... Ts>
    auto make(Ts&&... args) -> T* {
      if (_blocks.empty() || _used == _blockSize) {
        _blocks.push_back(std::allocator<T>().allocate(_blockSize));
        _used = 0;
      }
      auto const res = _blocks.back() + _used;
      std::construct_at(res, std::forward<Ts>(args)...);
      _used++;
      return res;
    }

  private:
    size_t _blockSize;
    std::vector<T*> _blocks;
    size_t _used = 0; // In the last block.

    auto _release() noexcept -> void {
      for (auto i = 0uz; i < _blocks.size(); i++) {
        std::destroy_n(_blocks[i], i + 1 == _blocks.size() ? _used : _blockSize);
        std::allocator<T>().deallocate(_blocks[i], _blockSize);
      }
      _blocks.clear();
      _used = 0;
    }
  };

}

#endif // NODEBOOK_COMMON_HPP

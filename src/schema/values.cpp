#include "values.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>

namespace nodebook::schema {
#include "macros_open.hpp"

  constexpr auto valueTypeNames = std::array<std::string_view, 5>{"string", "integer", "float", "date", "boolean"};

  auto valueTypeName(ValueType type) -> std::string_view {
    return valueTypeNames.at(static_cast<size_t>(type));
  }

  auto valueTypeFromName(std::string_view name) -> std::optional<ValueType> {
    for (auto i = 0uz; i < valueTypeNames.size(); i++)
      if (valueTypeNames[i] == name)
        return static_cast<ValueType>(i);
    if (name == "number")
      return ValueType::floating;
    if (name == "bool")
      return ValueType::boolean;
    return {};
  }

  auto isDigit(char c) -> bool {
    return c >= '0' && c <= '9';
  }

  auto isIntegerLiteral(std::string_view s) -> bool {
    auto const digits = s.starts_with('-') ? s.substr(1) : s;
    return !digits.empty() && std::ranges::all_of(digits, isDigit);
  }

  auto parseInteger(std::string_view s) -> std::optional<int64_t> {
    if (!isIntegerLiteral(s))
      return {};
    auto res = int64_t{};
    auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), res);
    if (ec != std::errc() || ptr != s.data() + s.size())
      return {};
    return res;
  }

  auto parseFloat(std::string_view s) -> std::optional<double> {
    if (s.empty())
      return {};
    auto res = 0.0;
    auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), res);
    if (ec != std::errc() || ptr != s.data() + s.size() || !std::isfinite(res))
      return {};
    return res;
  }

  auto daysInMonth(int32_t year, uint32_t month) -> uint32_t {
    constexpr auto days = std::array<uint32_t, 12>{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    auto const leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : days.at(month - 1);
  }

  auto parseDate(std::string_view s) -> std::optional<Date> {
    // YYYY-MM-DD
    if (s.size() != 10 || s[4] != '-' || s[7] != '-')
      return {};
    for (auto const i: {0, 1, 2, 3, 5, 6, 8, 9})
      if (!isDigit(s[i]))
        return {};
    auto const number = [&](size_t pos, size_t len) {
      auto res = 0u;
      std::from_chars(s.data() + pos, s.data() + pos + len, res);
      return res;
    };
    auto const res = Date{static_cast<int32_t>(number(0, 4)), number(5, 2), number(8, 2)};
    if (res.month < 1 || res.month > 12 || res.day < 1 || res.day > daysInMonth(res.year, res.month))
      return {};
    return res;
  }

  auto parseBoolean(std::string_view s) -> std::optional<bool> {
    auto lower = std::string(s);
    for (auto& c: lower)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true")
      return true;
    if (lower == "false")
      return false;
    return {};
  }

  auto parseValue(ValueType type, std::string_view literal) -> std::optional<Value> {
    switch (type) {
      case ValueType::string:
        if (literal.size() >= 2 && literal.front() == '"' && literal.back() == '"')
          return Value(std::string(literal.substr(1, literal.size() - 2)));
        return Value(std::string(literal));
      case ValueType::integer:
        if (auto const v = parseInteger(literal))
          return Value(*v);
        return {};
      case ValueType::floating:
        if (auto const v = parseFloat(literal))
          return Value(*v);
        return {};
      case ValueType::date:
        if (auto const v = parseDate(literal))
          return Value(*v);
        return {};
      case ValueType::boolean:
        if (auto const v = parseBoolean(literal))
          return Value(*v);
        return {};
    }
    unreachable;
  }

  auto toNumber(Value const& v) -> std::optional<double> {
    if (auto const i = std::get_if<int64_t>(&v))
      return static_cast<double>(*i);
    if (auto const d = std::get_if<double>(&v))
      return *d;
    return {};
  }

  auto formatNumber(double x) -> std::string {
    auto buf = std::array<char, 32>{};
    auto const [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), x);
    assert(ec == std::errc());
    return std::string(buf.data(), ptr);
  }

#include "macros_close.hpp"
}

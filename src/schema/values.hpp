#ifndef NODEBOOK_SCHEMA_VALUES_HPP
#define NODEBOOK_SCHEMA_VALUES_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <common.hpp>

namespace nodebook::schema {
#include "macros_open.hpp"

  enum class ValueType : uint32_t { string, integer, floating, date, boolean };

  // As written in schema files: "string", "integer", "float", "date", "boolean".
  auto valueTypeName(ValueType type) -> std::string_view;
  auto valueTypeFromName(std::string_view name) -> std::optional<ValueType>;

  struct Date {
    int32_t year;
    uint32_t month;
    uint32_t day;

    auto operator==(Date const&) const -> bool = default;
  };

  using Value = std::variant<std::string, int64_t, double, Date, bool>;

  // Each parser accepts the whole literal or nothing.
  auto isIntegerLiteral(std::string_view s) -> bool;                // `^-?\d+$`.
  auto parseInteger(std::string_view s) -> std::optional<int64_t>; // An integer literal that fits in 64 bits.
  auto parseFloat(std::string_view s) -> std::optional<double>;    // Finite numbers only.
  auto parseDate(std::string_view s) -> std::optional<Date>;       // `YYYY-MM-DD`, a real calendar day.
  auto parseBoolean(std::string_view s) -> std::optional<bool>;    // `true` or `false`, any case.
  auto parseValue(ValueType type, std::string_view literal) -> std::optional<Value>;

  // Integers and floats only.
  auto toNumber(Value const& v) -> std::optional<double>;

  // Shortest decimal form that reads back to the same `double`.
  auto formatNumber(double x) -> std::string;

#include "macros_close.hpp"
}

#endif // NODEBOOK_SCHEMA_VALUES_HPP

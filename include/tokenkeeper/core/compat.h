#ifndef TOKENKEEPER_COMPAT_H
#define TOKENKEEPER_COMPAT_H

// The library is built as C++17; optional and variant always come from std.

#include <optional>
#include <variant>

namespace tokenkeeper {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace tokenkeeper

#endif  // TOKENKEEPER_COMPAT_H

#ifndef CONDUIT_CORE_COMPAT_H
#define CONDUIT_CORE_COMPAT_H

#include <cstddef>
#include <optional>
#include <variant>

namespace conduit {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using bad_variant_access = std::bad_variant_access;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace conduit

#endif  // CONDUIT_CORE_COMPAT_H

/**
 * @file Types.hpp
 * @brief Shorthand aliases used throughout Xtend++.
 *
 * Every public header spells its types through these aliases so that the
 * plugin API, the CLI and the tests read the same way.
 */

#pragma once

#include <ankerl/unordered_dense.h> // ankerl::unordered_dense::map (UnorderedMap)
#include <any>                      // std::any (Any)
#include <array>                    // std::array (Array)
#include <atomic>                   // std::atomic (Atomic)
#include <expected>                 // std::expected
#include <functional>               // std::function (Fn)
#include <map>                      // std::map (Map)
#include <memory>                   // std::shared_ptr and std::unique_ptr (SharedPointer, UniquePointer)
#include <mutex>                    // std::mutex, std::recursive_mutex and std::lock_guard
#include <optional>                 // std::optional (Option)
#include <span>                     // std::span (Span)
#include <string>                   // std::string (String)
#include <string_view>              // std::string_view (StringView)
#include <utility>                  // std::pair (Pair)
#include <variant>                  // std::variant (Variant)
#include <vector>                   // std::vector (Vec)

namespace xtend::utils {
  namespace error {
    struct XtendError;
  } // namespace error

  namespace types {
    using u8  = std::uint8_t;  ///< 8-bit unsigned integer.
    using u16 = std::uint16_t; ///< 16-bit unsigned integer.
    using u32 = std::uint32_t; ///< 32-bit unsigned integer.
    using u64 = std::uint64_t; ///< 64-bit unsigned integer.
    using i8  = std::int8_t;   ///< 8-bit signed integer.
    using i16 = std::int16_t;  ///< 16-bit signed integer.
    using i32 = std::int32_t;  ///< 32-bit signed integer.
    using i64 = std::int64_t;  ///< 64-bit signed integer.
    using f32 = float;         ///< 32-bit floating-point number.
    using f64 = double;        ///< 64-bit floating-point number.

    using usize = std::size_t;    ///< Unsigned size type.
    using isize = std::ptrdiff_t; ///< Signed size type.

    using String     = std::string;      ///< Owning, mutable string.
    using StringView = std::string_view; ///< Non-owning view of a string.
    using CStr       = char;             ///< Single character type.
    using PCStr      = const char*;      ///< Pointer to a null-terminated string.

    using Unit       = void;           ///< Unit type, used as the "no value" success type.
    using RawPointer = void*;          ///< Type-erased pointer (dynamic library handles, symbols).
    using Exception  = std::exception; ///< Root of every exception plugin code may throw.
    using Any        = std::any;       ///< Type-erased value (plugin load arguments and results).

    using Mutex          = std::mutex;
    using RecursiveMutex = std::recursive_mutex;
    using LockGuard      = std::lock_guard<Mutex>;

    /**
     * @brief RAII guard for a re-entrant mutex.
     */
    using RecursiveLockGuard = std::lock_guard<RecursiveMutex>;

    template <typename Tp>
    using Atomic = std::atomic<Tp>;

    /**
     * @brief Alias for std::optional<Tp>.
     * @tparam Tp The type of the potential value.
     */
    template <typename Tp>
    using Option = std::optional<Tp>;

    /**
     * @brief The empty Option.
     */
    inline constexpr std::nullopt_t None = std::nullopt;

    /**
     * @brief Wraps a value in an Option.
     */
    template <typename Tp>
    constexpr auto Some(Tp&& value) -> Option<std::remove_reference_t<Tp>> {
      return std::make_optional<std::remove_reference_t<Tp>>(std::forward<Tp>(value));
    }

    template <typename Tp, usize sz>
    using Array = std::array<Tp, sz>;

    template <typename Tp>
    using Vec = std::vector<Tp>;

    template <typename Tp, usize sz = std::dynamic_extent>
    using Span = std::span<Tp, sz>;

    template <typename T1, typename T2>
    using Pair = std::pair<T1, T2>;

    template <typename... Ts>
    using Variant = std::variant<Ts...>;

    /**
     * @brief Ordered map with heterogeneous lookup (find by StringView works on String keys).
     */
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    /**
     * @brief Alias for ankerl::unordered_dense::map<Key, Val>.
     */
    template <typename Key, typename Val>
    using UnorderedMap = ankerl::unordered_dense::map<Key, Val>;

    template <typename Tp>
    using SharedPointer = std::shared_ptr<Tp>;

    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    /**
     * @brief Alias for std::function<Tp>.
     */
    template <typename Tp>
    using Fn = std::function<Tp>;

    /**
     * @typedef Result
     * @brief Either a success value of type Tp or an error of type Er.
     */
    template <typename Tp = Unit, typename Er = error::XtendError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Constructs a Result in its error state.
     */
    template <typename Er = error::XtendError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace xtend::utils

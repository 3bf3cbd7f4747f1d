#pragma once

#include <array>       // std::array
#include <cstddef>     // std::size_t, std::ptrdiff_t
#include <cstdint>     // std::{u,}int{8,16,32,64}_t
#include <exception>   // std::exception
#include <expected>    // std::{expected, unexpected}
#include <functional>  // std::function
#include <map>         // std::map
#include <memory>      // std::{shared_ptr, unique_ptr}
#include <mutex>       // std::{mutex, lock_guard}
#include <optional>    // std::{optional, nullopt}
#include <string>      // std::string
#include <string_view> // std::string_view
#include <tuple>       // std::tuple
#include <type_traits> // std::decay_t
#include <unordered_map>
#include <utility> // std::forward
#include <vector>  // std::vector

#ifndef fn
  #define fn auto
#endif

namespace nimbus::utils::error {
  struct NimbusError;
} // namespace nimbus::utils::error

namespace nimbus::utils::types {
  using u8  = std::uint8_t;
  using u16 = std::uint16_t;
  using u32 = std::uint32_t;
  using u64 = std::uint64_t;

  using i8  = std::int8_t;
  using i16 = std::int16_t;
  using i32 = std::int32_t;
  using i64 = std::int64_t;

  using f32 = float;
  using f64 = double;

  using usize = std::size_t;
  using isize = std::ptrdiff_t;

  using Unit = void;

  using CStr       = char;
  using PCStr      = const char*;
  using String     = std::string;
  using StringView = std::string_view;
  using RawPointer = void*;

  using Exception = std::exception;

  /**
   * @brief Result of an operation that may fail with a NimbusError.
   * @tparam Tp The success type, `void` by default.
   */
  template <typename Tp = Unit, typename Er = error::NimbusError>
  using Result = std::expected<Tp, Er>;

  using Err = std::unexpected<error::NimbusError>;

  template <typename Tp>
  using Option = std::optional<Tp>;

  inline constexpr std::nullopt_t None = std::nullopt;

  template <typename Tp>
  constexpr fn Some(Tp&& value) -> Option<std::decay_t<Tp>> {
    return std::make_optional<std::decay_t<Tp>>(std::forward<Tp>(value));
  }

  template <typename Tp, usize Sz>
  using Array = std::array<Tp, Sz>;

  template <typename Tp>
  using Vec = std::vector<Tp>;

  template <typename Key, typename Val>
  using Map = std::map<Key, Val>;

  template <typename Key, typename Val>
  using UnorderedMap = std::unordered_map<Key, Val>;

  template <typename... Ts>
  using Tuple = std::tuple<Ts...>;

  template <typename Sig>
  using Fn = std::function<Sig>;

  template <typename Tp>
  using SharedPointer = std::shared_ptr<Tp>;

  template <typename Tp, typename Dp = std::default_delete<Tp>>
  using UniquePointer = std::unique_ptr<Tp, Dp>;

  using Mutex     = std::mutex;
  using LockGuard = std::lock_guard<Mutex>;
} // namespace nimbus::utils::types

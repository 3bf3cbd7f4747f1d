#pragma once

#include <cctype>       // std::{isspace, tolower}
#include <charconv>     // std::from_chars
#include <system_error> // std::errc

#include "Types.hpp"

namespace nimbus::utils::strings {
  namespace types = ::nimbus::utils::types;

  /**
   * @brief Lower-cases UTF-8 text for case-insensitive comparison.
   * @details Folds ASCII letters and the Latin-1 Supplement capitals (À..Þ, except ×).
   * Every other byte is copied unchanged.
   */
  inline fn ToLowerCase(const types::StringView text) -> types::String {
    // UTF-8 lead byte of U+00C0..U+00FF.
    constexpr unsigned char LATIN1_LEAD = 0xC3;
    // Continuation bytes of À (U+00C0) .. Þ (U+00DE) and of × (U+00D7).
    constexpr unsigned char UPPER_FIRST = 0x80, UPPER_LAST = 0x9E, MULTIPLY_SIGN = 0x97;
    constexpr unsigned char CASE_OFFSET = 0x20;

    types::String result(text);

    for (types::usize idx = 0; idx < result.size(); ++idx) {
      const auto chr = static_cast<unsigned char>(result[idx]);

      if (chr == LATIN1_LEAD && idx + 1 < result.size()) {
        const auto next = static_cast<unsigned char>(result[idx + 1]);

        if (next >= UPPER_FIRST && next <= UPPER_LAST && next != MULTIPLY_SIGN)
          result[idx + 1] = static_cast<char>(next + CASE_OFFSET);

        ++idx;
      } else if (chr < 0x80)
        result[idx] = static_cast<char>(std::tolower(chr));
    }

    return result;
  }

  inline fn Trim(types::StringView text) -> types::StringView {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
      text.remove_prefix(1);

    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
      text.remove_suffix(1);

    return text;
  }

  /**
   * @brief Parses the whole of `text` as a number.
   * @details Surrounding blanks and one leading '+' are accepted; anything left over fails.
   */
  template <typename Number>
  fn ParseNumber(types::StringView text) -> types::Option<Number> {
    text = Trim(text);

    if (text.starts_with('+'))
      text.remove_prefix(1);

    if (text.empty())
      return types::None;

    Number value {};

    const auto [ptr, errc] = std::from_chars(text.data(), text.data() + text.size(), value);

    if (errc != std::errc {} || ptr != text.data() + text.size())
      return types::None;

    return value;
  }
} // namespace nimbus::utils::strings

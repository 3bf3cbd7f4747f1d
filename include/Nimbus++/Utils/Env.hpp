#pragma once

#include <cstdlib> // std::getenv, setenv, unsetenv

#include "Error.hpp"
#include "Types.hpp"

namespace nimbus::utils::env {
  namespace types = ::nimbus::utils::types;

  /**
   * @brief Reads an environment variable.
   * @param name Variable name.
   * @return The value, or NotFound when the variable is unset or empty.
   */
  inline fn GetEnv(const types::PCStr name) -> types::Result<types::String> {
    using enum error::NimbusErrorCode;

    const types::PCStr value = std::getenv(name); // NOLINT(concurrency-mt-unsafe)

    if (value == nullptr || *value == '\0')
      ERR_FMT(NotFound, "Environment variable '{}' is not set", name);

    return types::String(value);
  }

  inline fn SetEnv(const types::PCStr name, const types::PCStr value) -> types::Unit {
    setenv(name, value, 1); // NOLINT(concurrency-mt-unsafe)
  }

  inline fn UnsetEnv(const types::PCStr name) -> types::Unit {
    unsetenv(name); // NOLINT(concurrency-mt-unsafe)
  }
} // namespace nimbus::utils::env

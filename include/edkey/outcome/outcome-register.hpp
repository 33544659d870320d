/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>
#include <typeinfo>

#define OUTCOME_UNIQUE_CONCAT_INNER(a, b) a##b
#define OUTCOME_UNIQUE_CONCAT(a, b) OUTCOME_UNIQUE_CONCAT_INNER(a, b)
#define OUTCOME_UNIQUE OUTCOME_UNIQUE_CONCAT(_outcome_unique_, __COUNTER__)

namespace edkey::outcome::detail {

  /**
   * Error category of a single error-code enum. Message text comes from
   * the toString() specialization that OUTCOME_CPP_DEFINE_CATEGORY defines.
   */
  template <typename T>
  class Category : public std::error_category {
   public:
    const char *name() const noexcept final {
      return typeid(T).name();
    }

    std::string message(int c) const final {
      return toString(static_cast<T>(c));
    }

    static std::string toString(T t);
  };

  template <typename T>
  const std::error_category &getCategory() {
    static const Category<T> category{};
    return category;
  }

}  // namespace edkey::outcome::detail

#define OUTCOME_DECLARE_MAKE_ERROR_CODE(Enum) \
  std::error_code make_error_code(Enum e);

#define OUTCOME_DEFINE_MAKE_ERROR_CODE(Enum)                         \
  std::error_code make_error_code(Enum e) {                          \
    return {static_cast<int>(e),                                     \
            ::edkey::outcome::detail::getCategory<Enum>()};          \
  }

/// Register an error-code enum declared in namespace \a Namespace.
/// Must be placed in the global namespace, right after the enum.
#define OUTCOME_HPP_DECLARE_ERROR(Namespace, Enum)             \
  namespace std {                                              \
    template <>                                                \
    struct is_error_code_enum<Namespace::Enum> : true_type {}; \
  }                                                            \
                                                               \
  namespace Namespace {                                        \
    OUTCOME_DECLARE_MAKE_ERROR_CODE(Enum)                      \
  }

/// Define the message mapping of an error enum registered with
/// OUTCOME_HPP_DECLARE_ERROR. Followed by the function body, in which
/// \a Name is the enum value.
#define OUTCOME_CPP_DEFINE_CATEGORY(Namespace, Enum, Name) \
  namespace Namespace {                                    \
    OUTCOME_DEFINE_MAKE_ERROR_CODE(Enum)                   \
  }                                                        \
  template <>                                              \
  std::string edkey::outcome::detail::Category<            \
      Namespace::Enum>::toString(Namespace::Enum Name)

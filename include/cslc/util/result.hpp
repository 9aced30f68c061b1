#ifndef CSLC_RESULT_HPP
#define CSLC_RESULT_HPP

#include <concepts>
#include <type_traits>
#include <utility>
#include <variant>

#include "cslc/util/assert.hpp"

#include "cslc/fwd.hpp"

namespace cslc {

struct Success_Tag { };
inline constexpr Success_Tag success_tag;

struct Error_Tag { };
inline constexpr Error_Tag error_tag;

/// @brief Holds either a value of type `T` or an error of type `Error`.
/// Both alternatives are implicitly constructible,
/// so a function returning `Result<T, E>` can simply `return value;` or `return error;`.
template <typename T, typename Error>
struct [[nodiscard]] Result {
    static_assert(!std::is_same_v<T, Error>, "Use success_tag/error_tag for identical types.");

    using value_type = T;
    using error_type = Error;

private:
    std::variant<T, Error> m_storage;

public:
    [[nodiscard]]
    constexpr Result()
        requires std::is_default_constructible_v<T>
        : m_storage { std::in_place_index<0> }
    {
    }

    [[nodiscard]]
    constexpr Result(const T& value)
        : m_storage { std::in_place_index<0>, value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        : m_storage { std::in_place_index<0>, std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const Error& error)
        : m_storage { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr Result(Error&& error)
        : m_storage { std::in_place_index<1>, std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Success_Tag, Args&&... args)
        : m_storage { std::in_place_index<0>, std::forward<Args>(args)... }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_storage { std::in_place_index<1>, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_storage.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        CSLC_ASSERT(has_value());
        return *std::get_if<0>(&m_storage);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        CSLC_ASSERT(has_value());
        return *std::get_if<0>(&m_storage);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        CSLC_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_storage));
    }

    [[nodiscard]]
    constexpr Error& error() &
    {
        CSLC_ASSERT(!has_value());
        return *std::get_if<1>(&m_storage);
    }

    [[nodiscard]]
    constexpr const Error& error() const&
    {
        CSLC_ASSERT(!has_value());
        return *std::get_if<1>(&m_storage);
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }

    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }

    template <typename U>
    [[nodiscard]]
    constexpr T value_or(U&& alternative) const&
    {
        return has_value() ? value() : static_cast<T>(std::forward<U>(alternative));
    }
};

template <typename Error>
struct [[nodiscard]] Result<void, Error> {
    using value_type = void;
    using error_type = Error;

private:
    bool m_has_value = true;
    Error m_error {};

public:
    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(Success_Tag) noexcept
    {
    }

    [[nodiscard]]
    constexpr Result(const Error& error)
        : m_has_value { false }
        , m_error { error }
    {
    }

    [[nodiscard]]
    constexpr Result(Error_Tag, const Error& error)
        : m_has_value { false }
        , m_error { error }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_has_value;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_has_value;
    }

    [[nodiscard]]
    constexpr Error error() const
    {
        CSLC_ASSERT(!m_has_value);
        return m_error;
    }
};

} // namespace cslc

#endif

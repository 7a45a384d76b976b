#ifndef LAMP_RESULT_HPP
#define LAMP_RESULT_HPP

#include <expected>
#include <type_traits>
#include <utility>

namespace lamp {

/// @brief Either a value of type `T`, or an error of type `E`.
/// Unlike `std::expected`, this type is implicitly constructible from an `E`,
/// so that functions can simply `return error;`.
/// `T` and `E` shall be distinct types.
template <typename T, typename E>
struct [[nodiscard]] Result : std::expected<T, E> {
    static_assert(!std::is_same_v<T, E>, "Result requires distinct value and error types.");

    using std::expected<T, E>::expected;

    [[nodiscard]]
    constexpr Result()
        = default;

    [[nodiscard]]
    constexpr Result(const E& error)
        : std::expected<T, E> { std::unexpect, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : std::expected<T, E> { std::unexpect, std::move(error) }
    {
    }
};

} // namespace lamp

#endif

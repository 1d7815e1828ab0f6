/*
Module Name:
- transparent_string_less.hpp

Abstract:
- Transparent ordering for string keyed std::map and std::set.
- Registry lookups arrive as std::string_view slices of an inbound line; this lets them
  probe std::string keys without building a temporary.
- Uses GSL Expects to reject a null const char* which would be UB.
*/
#pragma once

// C++ Standard Library
#include <concepts>
#include <string_view>
#include <type_traits>

// GSL
#include <gsl/gsl>

namespace irc_bot
{

    namespace detail
    {
        // Gates the null check to raw C strings.
        template<class T>
        inline constexpr bool is_c_string_v =
            std::is_pointer_v<std::remove_cvref_t<T>> &&
            std::same_as<std::remove_cv_t<std::remove_pointer_t<std::remove_cvref_t<T>>>, char>;
    } // namespace detail

    struct TransparentStringLess
    {
        using is_transparent = void; // opts in to heterogeneous lookup

        template<std::convertible_to<std::string_view> A, std::convertible_to<std::string_view> B>
        bool operator()(const A& a, const B& b) const noexcept
        {
            if constexpr (detail::is_c_string_v<A>)
            {
                Expects(a != nullptr);
            }
            if constexpr (detail::is_c_string_v<B>)
            {
                Expects(b != nullptr);
            }
            return std::string_view{ a } < std::string_view{ b };
        }
    };

} // namespace irc_bot

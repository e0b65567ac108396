#pragma once

#include <type_traits>

#include <clean-core/string_view.hh>

namespace ri::detail
{
template <class T, class = void>
struct can_be_string_view_t : std::false_type
{
};
template <class T>
struct can_be_string_view_t<T, std::void_t<decltype(cc::string_view(std::declval<T>()))>> : std::true_type
{
};

template <class T>
static constexpr bool can_be_string_view = can_be_string_view_t<T>::value;

template <class T, class = void>
struct is_equality_comparable_t : std::false_type
{
};
template <class T>
struct is_equality_comparable_t<T, std::void_t<decltype(std::declval<T const&>() == std::declval<T const&>())>> : std::true_type
{
};

/// cached widget state must be comparable so unchanged frames can be detected
template <class T>
static constexpr bool is_equality_comparable = is_equality_comparable_t<T>::value;
}

// numeric.hpp
// Small generic numeric helpers: doubling any arithmetic value and a
// printable floating-point wrapper.

#ifndef GDS_NUMERIC_HPP
#define GDS_NUMERIC_HPP

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include "print.hpp"

namespace gds
{

    /* Returns 2 * n in n's own type (so double_value(int8_t{3}) is an int8_t).
     * Integers wrap on overflow: double_value(INT_MAX) == -2. */
    template <typename T>
    constexpr T double_value(T n)
    {
        static_assert(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>,
                      "double_value requires an integer or floating-point type");
        if constexpr (std::is_integral_v<T>)
        {
            // unsigned arithmetic is modular, signed overflow is not
            using U = std::make_unsigned_t<T>;
            return static_cast<T>(static_cast<U>(static_cast<U>(n) * 2u));
        }
        else
        {
            return 2 * n;
        }
    }

    /*-------------------------------------------------------------------------
     *  class PrintableFloat
     *-------------------------------------------------------------------------
     *  A double that knows how to render itself: to_string() and operator<<
     *  both produce exactly two decimal places ("3.14", "-0.50", "2.00").
     *-------------------------------------------------------------------------*/
    class PrintableFloat
    {
    public:
        constexpr PrintableFloat(double v = 0.0) noexcept : value(v) {}

        constexpr operator double() const noexcept { return value; }

        std::string to_string() const;

    private:
        double value;
    };

    std::ostream &operator<<(std::ostream &os, const PrintableFloat &pf);

    namespace detail
    {
        template <typename T, typename = void>
        struct has_to_string : std::false_type
        {
        };

        template <typename T>
        struct has_to_string<T, std::void_t<decltype(std::declval<const T &>().to_string())>>
            : std::is_convertible<decltype(std::declval<const T &>().to_string()), std::string>
        {
        };
    } // namespace detail

    /*-------------------------------------------------------------------------
     *  is_printable_numeric<T>
     *-------------------------------------------------------------------------
     *  True for class types that behave as an int or a double (implicitly
     *  convertible to one) and render themselves through to_string().
     *-------------------------------------------------------------------------*/
    template <typename T>
    struct is_printable_numeric
        : std::bool_constant<std::is_class_v<T> &&
                             (std::is_convertible_v<T, int> || std::is_convertible_v<T, double>) &&
                             detail::has_to_string<T>::value>
    {
    };

    template <typename T>
    inline constexpr bool is_printable_numeric_v = is_printable_numeric<T>::value;

    /* Prints value.to_string() on its own line. */
    template <typename T>
    void print_printable(const T &value)
    {
        static_assert(is_printable_numeric_v<T>,
                      "print_printable requires a numeric type with to_string()");
        util::println("{}", value.to_string());
    }

} // namespace gds

#endif // GDS_NUMERIC_HPP

#pragma once
#include <string>
#include <type_traits>
#include <vector>

namespace nexus { namespace cmdargs {

/** Returns an argument name for T.  For numeric types, this is one of ℝ (for floating point
 * values), ℕ (for unsigned integer types), or ℤ (for signed integer types).  For other types, this
 * is simply "arg".
 */
template <typename T>
std::string type_string() {
    return std::is_floating_point<T>::value ? u8"ℝ" :
        std::is_integral<T>::value ? std::is_unsigned<T>::value ? u8"ℕ" : u8"ℤ" :
        u8"arg";
}

/** Returns a value converted to a string; in most cases this just passes the value to
 * std::to_string for conversion.
 */
template <typename T, typename = typename std::enable_if<std::is_arithmetic<T>::value>::type>
std::string output_string(T v) {
    return std::to_string(v);
}

/** Splits a list such as "CA,TX, NY" at `sep`, trimming whitespace around each element and
 * dropping empty elements.
 */
std::vector<std::string> split_list(const std::string &list, char sep = ',');

}}

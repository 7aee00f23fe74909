#pragma once
#include "nexus/cmdargs/strings.hpp"
#include <boost/any.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <regex>
#include <string>
#include <type_traits>
#include <vector>

namespace nexus { namespace cmdargs {

/** Validation tag; any Validation class must (ultimately) inherit from this class. */
class ValidationTag {};

/** Validation wrapper base class.  This base class does no value validation of its own.
 *
 * If `T` is an unsigned type, parsing into a Validation (or derived class) makes sure the given
 * value is not negative; without this, boost would convert a value of -1 for an unsigned int into
 * 4294967295.
 */
template <typename T>
class Validation : public ValidationTag {
    public:
        /// Constructs with an initial value
        Validation(T v) : val_(v) {}
        /// Implicit conversion to the stored value
        operator const T& () const { return val_; }
        /// The type T that this object validates
        using value_type = T;
        /// Returns a string representation of this validation object
        static std::string validationString() {
            if (std::is_unsigned<T>::value) { return type_string<T>() + u8"⩾0"; }
            return type_string<T>();
        }
        /// Virtual destructor
        virtual ~Validation() = default;

    protected:
        /// The stored value
        T val_;
};

/** Validation wrapper for options that have a maximum value.
 *
 * \param T any numeric type.
 * \param max the maximum accepted value.
 */
template <typename T, long max>
class Max : public Validation<T> {
    public:
        /// Constructor.  Throws if `v > max`.
        Max(T v) : Validation<T>(v) {
            if (*this > max)
                throw boost::program_options::validation_error(boost::program_options::validation_error::invalid_option_value);
        }

        /// Returns string representation of this validation
        static std::string validationString() { return type_string<T>() + u8"⩽" + output_string(max); }
};

/** Overload of validate for boost to convert from string to a validated data type.  The value is
 * converted to `V::value_type`, then wrapped in a `V`, whose constructor throws if validation
 * fails.  Values with a leading minus sign are rejected for unsigned types.
 */
template <class V, typename = typename std::enable_if<std::is_base_of<ValidationTag, V>::value>::type>
void validate(boost::any &v, const std::vector<std::string> &values, V*, int) {
    using namespace boost::program_options;

    validators::check_first_occurrence(v);
    std::string s(validators::get_single_string(values));

    if (std::is_unsigned<typename V::value_type>::value and std::regex_search(s, std::regex("^\\s*-")))
        throw invalid_option_value(s);

    typename V::value_type val;
    try {
        val = boost::lexical_cast<typename V::value_type>(s);
    }
    catch (const boost::bad_lexical_cast&) {
        throw invalid_option_value(s);
    }
    v = boost::any(V(val));
}

}}

#pragma once
#include "nexus/cmdargs/Validation.hpp"
#include "nexus/cmdargs/strings.hpp"
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <string>
#include <type_traits>
#include <vector>

namespace boost { namespace program_options { class variables_map; } }

namespace nexus {
/// Namespace for command-line argument handling classes.
namespace cmdargs {

/** This class handles command line argument parsing.  Subclasses add the options of a particular
 * program by overriding addOptions(), and interpret the parsed values in postParse().
 */
class CmdArgs {

    protected:
        /// Default constructor is protected; use a suitable subclass.
        CmdArgs() = default;

    public:
        /// Virtual destructor
        virtual ~CmdArgs() = default;

        /** Parses options and verifies them.  Throws an std::exception-derived exception for
         * various errors (such as invalid arguments or invalid argument types).
         *
         * The --help and --version arguments are handled internally: they print the requested info,
         * then exit the program.
         *
         * \param argc the argc as received by main
         * \param argv the argv as received by main
         */
        void parse(int argc, char const* const* argv);

        /** Creates an option value for a boolean value, that is, for an switch without an argument,
         * with default value as given in `store`.
         */
        static boost::program_options::typed_value<bool>* value(bool& store) {
            return boost::program_options::bool_switch(&store)->default_value(store);
        }

        /** Creates an option value object with explicit validation wrapper class V, such as
         * `Max<unsigned, 8>`.  `store` is used for both the default and the location to store a
         * command-line provided value.
         *
         * \tparam V a class that will throw during construction if the given value isn't valid; the
         * class must expose a value type in `value_type`, which should match the given `store`
         * value.
         * \param store the location of the default value and the location to store a given value
         */
        template <typename V>
        static boost::program_options::typed_value<V>*
        value(typename V::value_type &store) {
            return boost::program_options::value<V>()->default_value(store)->value_name(V::validationString())
                ->notifier([&store](const V &v) { store = v; /* NB: implicit conversion */ });
        }

        /** Takes a std::vector of values for options that store multiple values. */
        template <typename T, typename A>
        static typename std::enable_if<not std::is_unsigned<T>::value, boost::program_options::typed_value<std::vector<T, A>>*>::type
        value(std::vector<T, A> &store) {
            return boost::program_options::value<std::vector<T, A>>(&store)->value_name(
                    type_string<T>() + " [" + type_string<T>() + " ...]");
        }

        /// Shortcut for `value<Max<T, n>>(val)` with `T` last (so that it can be inferred from `val`)
        template <long maximum, typename T>
        static boost::program_options::typed_value<Max<T, maximum>>* max(T &store) { return value<Max<T, maximum>>(store); }

        /// Returns a version string, including versionSuffix().
        virtual std::string version() const;

        /// Returns a suffix appended to the version string; empty by default.
        virtual std::string versionSuffix() const;

        /** Returns a usage string such as "Usage: program [ARGS]".  Called by help().  Subclasses should
         * override to change the string as needed.
         */
        virtual std::string usage() const;

        /// Returns a argument help message.
        virtual std::string help() const;

    protected:
        /** Adds options.  This method is called automatically by parse() before parsing arguments
         * if nothing has been set in the options_ object; the default implementation adds --help
         * and --version options.  Subclasses should override and enhance to also populate
         * `options_` appropriately.
         */
        virtual void addOptions();

        /** The program name, populated by parse(). */
        std::string prog_name_;

        /// The options descriptions variable for all options.
        boost::program_options::options_description options_;

        /** Does nothing; subclasses should override if needed to deal with argument values.  This
         * is called after checking for and handling --help or --version flags.
         *
         * \param vars the parsed variables
         */
        virtual void postParse(boost::program_options::variables_map &vars);
};

}}

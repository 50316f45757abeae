/*
 * options.h
 *
 * command line option processing
 */

#ifndef OPTIONS_H
#define OPTIONS_H

#include <stdio.h>
#include <string.h>
#include <string>
#include <utility>
#include <vector>

/*
 * example use of class option_processor
 *
 *    option_processor opt({{ argument::none,     "--one", "-1", "first argument" },
 *                          { argument::required, "--two", "",   "second argument" }});
 *
 * Each option has a long name and, optionally, a short alias; an
 * empty alias means that the option has no short form.
 */

namespace cbd_option {

    enum class argument {
        required,
        none
    };

    class option {
        std::string name;
        std::string alias;
        argument arg;
        std::string documentation;
        std::string value;
        bool value_is_set;

    public:
        option(argument opt_arg, const std::string &opt_name, const std::string &opt_alias, std::string opt_doc) :
            name{opt_name},
            alias{opt_alias},
            arg{opt_arg},
            documentation{opt_doc},
            value{},
            value_is_set{false}
        { }

        bool matches(const char *option_name) const {
            return name.compare(option_name) == 0 || (!alias.empty() && alias.compare(option_name) == 0);
        }

        bool arg_type(argument a) const { return (a == arg); }

        const char *get_name() const { return name.c_str(); }

        const char *get_alias() const { return alias.c_str(); }

        const char *get_doc() const { return documentation.c_str(); }

        std::pair<bool, std::string> get_value() const {
            return {value_is_set, value};
        }

        void set_value(const char *v) {
            value = v;
            value_is_set = true;
        }

        void set_value() {
            value_is_set = true;
        }

        bool is_set() const { return value_is_set; }

        const char *get_type_string() const {
            if (arg_type(argument::required)) {
                return "<arg>";
            }
            return "";
        }

    };

    class option_processor {
        std::vector<option> option_vector;

    public:
        option_processor(const std::vector<option> &opts) : option_vector{opts} { }

        option *find_option_by_name(const char *arg) {
            for (option &o : option_vector) {
                if (o.matches(arg)) {
                    return &o;
                }
            }
            return nullptr;
        }

        // process_argv() returns true if every element of argv (after
        // the program name) is an option or the argument of the
        // option before it, and false otherwise
        //
        bool process_argv(int argc, char *argv[]) {
            argv = &argv[1];  argc--;  // skip program name

            option *last_option = nullptr;
            for (int i=0; i<argc; i++) {
                if (last_option) {
                    last_option->set_value(argv[i]);
                    last_option = nullptr;

                } else {
                    last_option = find_option_by_name(argv[i]);
                    if (last_option == nullptr) {
                        fprintf(stderr, "error: \"%s\" does not match any option name\n", argv[i]);
                        return false;
                    }
                    if (last_option->arg_type(argument::none)) {
                        last_option->set_value();
                        last_option = nullptr;
                    }
                }
            }
            if (last_option) {
                fprintf(stderr, "error: option \"%s\" requires an argument\n", last_option->get_name());
                return false;
            }
            return true;
        }

        void usage(FILE *f, const char *progname, const char *summary) {
            fprintf(f, "usage: %s %s", progname, summary);
            const char *whitespace = "                  ";
            for (option &o : option_vector) {
                int white_len = strlen(whitespace) - strlen(o.get_name()) - strlen(o.get_type_string());
                white_len = white_len > 0 ? white_len : 0;
                fprintf(f, "   %-2s %s %s %.*s%s\n", o.get_alias(), o.get_name(), o.get_type_string(), white_len, whitespace, o.get_doc());
            }
            fputc('\n', f);
        }

        std::pair<bool, std::string> get_value(const char *name) const {
            for (const option &o : option_vector) {
                if (o.matches(name)) {
                    return o.get_value();
                }
            }
            return { false, "" }; // error: option name not found
        }

        bool is_set(const char *name) const {
            for (const option &o : option_vector) {
                if (o.matches(name)) {
                    return o.is_set();
                }
            }
            return false;  // error: option name not found
        }

    };

} // namespace cbd_option

#endif // OPTIONS_H

/* **********************************************************
 * Copyright (c) 2026 Google, Inc.  All rights reserved.
 * **********************************************************/

/*
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice,
 *   this list of conditions and the following disclaimer.
 *
 * * Redistributions in binary form must reproduce the above copyright notice,
 *   this list of conditions and the following disclaimer in the documentation
 *   and/or other materials provided with the distribution.
 *
 * * Neither the name of Google, Inc. nor the names of its contributors may be
 *   used to endorse or promote products derived from this software without
 *   specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL VMWARE, INC. OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
 * LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY
 * OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH
 * DAMAGE.
 */
/**
 * @file ftoption.h
 * @brief Command-line option parsing for the fibertrace frontend.
 *
 * Options are declared as global ftoption_t<T> objects which register
 * themselves in a static list at construction.  A single call to
 * ftoption_parser_t::parse_argv() fills them all in.
 */

#ifndef _FTOPTION_H_
#define _FTOPTION_H_ 1

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace fibertrace {
namespace ftoption {

/**
 * Option parser base class.
 */
class ftoption_parser_t {
public:
    ftoption_parser_t(std::string name, std::string desc_short, std::string desc_long)
        : name_(name)
        , is_specified_(false)
        , desc_short_(desc_short)
        , desc_long_(desc_long)
    {
        // We assume no synch is needed as this is a static initializer.
        allops().push_back(this);
    }

    virtual ~ftoption_parser_t() = default;

    /**
     * Parses argv and fills in every registered ftoption_t.
     * On success, returns true, with the index of the first unparsed token
     * returned in \p last_index: that is the token after a "--" separator, or
     * the first token not starting with a dash.
     * On failure, returns false, stores a description in \p error_msg if it is
     * non-NULL, and sets \p last_index to the problematic token.
     */
    static bool
    parse_argv(int argc, const char *argv[], std::string *error_msg, int *last_index)
    {
        int i;
        bool res = true;
        for (i = 1 /*skip tool*/; i < argc; ++i) {
            if (strcmp(argv[i], "--") == 0) {
                ++i; // for last_index
                break;
            }
            // Stop on the first non-option so the child's argv needs no "--".
            if (argv[i][0] != '-')
                break;
            ftoption_parser_t *match = nullptr;
            for (ftoption_parser_t *op : allops()) {
                if (op->name_match(argv[i])) {
                    match = op;
                    break;
                }
            }
            if (match == nullptr) {
                if (error_msg != nullptr)
                    *error_msg = std::string("Unknown option: ") + argv[i];
                res = false;
                break;
            }
            if (match->option_takes_arg()) {
                ++i;
                if (i == argc) {
                    if (error_msg != nullptr)
                        *error_msg = "Option " + match->get_name() + " missing value";
                    res = false;
                    break;
                }
                if (!match->convert_from_string(argv[i]) || !match->clamp_value()) {
                    if (error_msg != nullptr) {
                        *error_msg =
                            "Option " + match->get_name() + " value out of range";
                    }
                    res = false;
                    break;
                }
            }
            match->is_specified_ = true; // *after* convert_from_string()
        }
        if (last_index != nullptr)
            *last_index = i;
        return res;
    }

    /**
     * Returns a string containing a list of all of the parameters, their
     * default values, and their short descriptions.
     */
    static std::string
    usage_short()
    {
        std::ostringstream oss;
        for (ftoption_parser_t *op : allops()) {
            oss << " -" << std::setw(20) << std::left << op->get_name() << "["
                << std::setw(6) << std::right << op->default_as_string() << "]"
                << "  " << std::left << op->desc_short_ << std::endl;
        }
        return oss.str();
    }

    /**
     * Returns a string containing each parameter with its default value and
     * long description.
     */
    static std::string
    usage_long()
    {
        std::ostringstream oss;
        for (ftoption_parser_t *op : allops()) {
            oss << "----------\n-" << op->get_name() << "\n"
                << "default value: " << op->default_as_string() << "\n"
                << op->desc_long_ << "\n"
                << std::endl;
        }
        return oss.str();
    }

    /** Returns whether this option was specified in the argument list. */
    bool
    specified() const
    {
        return is_specified_;
    }
    /** Returns the name of this option. */
    std::string
    get_name() const
    {
        return name_;
    }

    /** Resets every option to its default, for callers that parse more than once. */
    static void
    clear_values()
    {
        for (ftoption_parser_t *op : allops())
            op->clear_value();
    }

protected:
    virtual bool
    option_takes_arg() const = 0;
    virtual bool
    name_match(const char *arg) = 0; // also sets value for bools!
    virtual bool
    convert_from_string(const std::string &s) = 0;
    virtual bool
    clamp_value() = 0;
    virtual std::string
    default_as_string() const = 0;
    virtual void
    clear_value() = 0;

    // To avoid static initializer ordering problems we use a function:
    static std::vector<ftoption_parser_t *> &
    allops()
    {
        static std::vector<ftoption_parser_t *> allops_vec_;
        return allops_vec_;
    }

    std::string name_;
    bool is_specified_;
    std::string desc_short_;
    std::string desc_long_;
};

/** Option class for declaring new options. */
template <typename T> class ftoption_t : public ftoption_parser_t {
public:
    /**
     * Declares a new option of type T with the given default value and
     * description in short and long forms.
     */
    ftoption_t(std::string name, T defval, std::string desc_short, std::string desc_long)
        : ftoption_parser_t(name, desc_short, desc_long)
        , value_(defval)
        , defval_(defval)
        , has_range_(false)
    {
    }

    /**
     * Declares a new option of type T with the given default value, minimum
     * and maximum values, and description in short and long forms.
     */
    ftoption_t(std::string name, T defval, T minval, T maxval, std::string desc_short,
               std::string desc_long)
        : ftoption_parser_t(name, desc_short, desc_long)
        , value_(defval)
        , defval_(defval)
        , has_range_(true)
        , minval_(minval)
        , maxval_(maxval)
    {
    }

    /** Returns the value of this option. */
    T
    get_value() const
    {
        return value_;
    }

    /** Sets the value of this option, overriding the command line. */
    void
    set_value(T new_value)
    {
        value_ = new_value;
    }

    void
    clear_value() override
    {
        value_ = defval_;
        is_specified_ = false;
    }

protected:
    bool
    clamp_value() override
    {
        if (has_range_) {
            if (value_ < minval_) {
                value_ = minval_;
                return false;
            } else if (value_ > maxval_) {
                value_ = maxval_;
                return false;
            }
        }
        return true;
    }

    bool
    option_takes_arg() const override;
    bool
    name_match(const char *arg) override;
    bool
    convert_from_string(const std::string &s) override;
    std::string
    default_as_string() const override;

    T value_;
    T defval_;
    bool has_range_;
    T minval_ = T();
    T maxval_ = T();
};

template <typename T>
inline bool
ftoption_t<T>::option_takes_arg() const
{
    return true;
}
template <>
inline bool
ftoption_t<bool>::option_takes_arg() const
{
    return false;
}

template <typename T>
inline bool
ftoption_t<T>::name_match(const char *arg)
{
    return std::string("-").append(name_) == arg ||
        std::string("--").append(name_) == arg;
}
template <>
inline bool
ftoption_t<bool>::name_match(const char *arg)
{
    if (std::string("-").append(name_) == arg || std::string("--").append(name_) == arg) {
        value_ = true;
        return true;
    }
    if (std::string("-no").append(name_) == arg ||
        std::string("-no_").append(name_) == arg ||
        std::string("--no").append(name_) == arg ||
        std::string("--no_").append(name_) == arg) {
        value_ = false;
        return true;
    }
    return false;
}

template <>
inline bool
ftoption_t<std::string>::convert_from_string(const std::string &s)
{
    value_ = s;
    return true;
}
template <>
inline bool
ftoption_t<int>::convert_from_string(const std::string &s)
{
    errno = 0;
    char *end = nullptr;
    long input = strtol(s.c_str(), &end, 0);
    if (end == s.c_str() || *end != '\0')
        return false;
    if (input >= (long)INT_MIN && input <= (long)INT_MAX)
        value_ = (int)input;
    else
        return false;
    return errno == 0;
}
template <>
inline bool
ftoption_t<unsigned int>::convert_from_string(const std::string &s)
{
    errno = 0;
    char *end = nullptr;
    long input = strtol(s.c_str(), &end, 0);
    if (end == s.c_str() || *end != '\0')
        return false;
    // Is the value positive and fits into an unsigned integer?
    if (input >= 0 && (unsigned long)input <= (unsigned long)UINT_MAX)
        value_ = (unsigned int)input;
    else
        return false;
    return errno == 0;
}
template <>
inline bool
ftoption_t<double>::convert_from_string(const std::string &s)
{
    char *end = nullptr;
    errno = 0;
    value_ = strtod(s.c_str(), &end);
    return end != s.c_str() && *end == '\0' && errno == 0;
}
template <>
inline bool
ftoption_t<bool>::convert_from_string(const std::string &s)
{
    // We shouldn't get here
    return false;
}

template <typename T>
inline std::string
ftoption_t<T>::default_as_string() const
{
    std::ostringstream stream;
    stream << std::dec << defval_;
    return stream.str();
}
template <>
inline std::string
ftoption_t<std::string>::default_as_string() const
{
    return defval_.empty() ? "\"\"" : defval_;
}
template <>
inline std::string
ftoption_t<bool>::default_as_string() const
{
    return (defval_ ? "true" : "false");
}

} // namespace ftoption
} // namespace fibertrace

#endif /* _FTOPTION_H_ */

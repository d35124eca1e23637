// -*- c++ -*-

#pragma once
#include "config.hpp"

#include <exception>
#include <utility>
#include <cstdio>
#include <cstring>


_FZD_NAMESPACE_BEGIN


/* va_error -- exception w/ a printf-style formatted message. every error the library throws derives from it. */

class va_error : public std::exception {
    char _msg[512];

public:
    template<class... Args>
    explicit va_error(const char* format, Args&&... args) {
        snprintf(&_msg[0], sizeof(_msg), format, std::forward<Args>(args)...);
    }

    explicit va_error(const char* msg) {
        snprintf(&_msg[0], sizeof(_msg), "%s", msg);
    }

    const char* what() const noexcept override { return &_msg[0]; }
};


/* a rule rejected a candidate value during construction */
class validation_error : public va_error {
    char _rule[64];

public:
    validation_error(const char* rule, const char* msg) : va_error(msg) {
        snprintf(&_rule[0], sizeof(_rule), "%s", rule);
    }

    const char* rule() const noexcept { return &_rule[0]; }
};


/* text handed to a parser was not in the expected shape */
class format_error : public va_error {
public:
    template<class... Args>
    explicit format_error(const char* format, Args&&... args) : va_error(format, std::forward<Args>(args)...) {}
};


/* a required pointer argument was null */
class null_argument_error : public va_error {
public:
    explicit null_argument_error(const char* arg_name)
        : va_error("Argument '%s' must not be null", arg_name) {}
};


_FZD_NAMESPACE_END

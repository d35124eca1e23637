#pragma once
#include "config.hpp"

#include <vector>
#include <utility>
#include <cstdio>


_FZD_NAMESPACE_BEGIN


struct error {
    const char* _rule; // name of the reporting rule; rules have static-lifetime names
    char _msg[256];

    template<class... Args>
    error(const char* rule, const char* format, Args&&... args)
        : _rule(rule)
    {
        snprintf(&_msg[0], sizeof(_msg), format, std::forward<Args>(args)...);
    }

    const char* rule() const noexcept { return _rule; }
    const char* msg()  const noexcept { return &_msg[0]; }
};


class error_queue {
    typedef std::vector<error> vec_t;
    vec_t _vec;

public:
    template<class... Args>
    void enqueue(const char* rule, const char* format, Args&&... args) {
        _vec.emplace_back(rule, format, std::forward<Args>(args)...);
    }

    const error& front() const { return _vec.front(); }

    vec_t::size_type      size() const  { return _vec.size(); }
    bool                  empty() const { return size() == 0; }
    vec_t::const_iterator begin() const { return _vec.cbegin(); }
    vec_t::const_iterator end() const   { return _vec.cend(); }
};


_FZD_NAMESPACE_END

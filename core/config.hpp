// -*- c++ -*-

#pragma once

#include <cstdint>
#include <cstddef>

#define _FZD_NAMESPACE_BEGIN namespace fzd {
#define _FZD_NAMESPACE_END   }

typedef unsigned int uint;

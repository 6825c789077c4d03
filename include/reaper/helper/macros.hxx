// MIT License
//
// Copyright (c) 2021-2022. Seungwoo Kang
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
// project home: https://github.com/perfkitpp

#ifndef REAPER_HELPER_MACROS_HXX
#define REAPER_HELPER_MACROS_HXX
#include <type_traits>

#define INTERNAL_REAPER_CONCAT2(A, B) A##B
#define INTERNAL_REAPER_CONCAT(A, B)  INTERNAL_REAPER_CONCAT2(A, B)

/* "helper/exception.hxx" *************************************************************************/
#define REAPER_DECLARE_EXCEPTION(Name, Base)                      \
    struct Name : Base {                                          \
        using _reaper_internal_super = Base;                      \
        using _reaper_internal_super::_reaper_internal_super;     \
    }

/* template utilities *****************************************************************************/
#define REAPER_SFINAE_EXPR(Name, TParam, ...)                                  \
    template <typename TParam, class = void>                                   \
    struct Name : std::false_type {                                            \
    };                                                                         \
    template <typename TParam>                                                 \
    struct Name<TParam, std::void_t<decltype(__VA_ARGS__)>> : std::true_type { \
    };                                                                         \
                                                                               \
    template <typename TParam>                                                 \
    constexpr bool INTERNAL_REAPER_CONCAT(Name, _v) = Name<TParam>::value;

#define REAPER_REQUIRE(...) class = std::enable_if_t<(__VA_ARGS__)>

#endif

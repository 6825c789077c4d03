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

#pragma once
#include <string_view>

#include "helper/macros.hxx"
#include "object/object.hxx"

namespace reaper {
/**
 * Transparent destroyer over dynamic objects.
 *
 * Every operation except release(), isa() and can() is forwarded by name to the wrapped
 *  object, which receives the call as if it was made on itself. Missing operations fail with
 *  exactly the same no_such_operation as a direct call would. Calling "new" through an
 *  instance is forwarded as well, thus produces a plain object rather than another wrapper.
 *
 * "cleanup" is not forwarded. Invoking it is the same as release(), so the wrapped object
 *  is still cleaned up at most once.
 *
 * type_of() and the free isa() report the destroyer's own identity.
 */
class dynamic_destroyer
{
    object_ptr _inner;

   private:
    explicit dynamic_destroyer(object_ptr inner) noexcept : _inner(std::move(inner)) {}

    static dynamic_destroyer _wrap_object(object_ptr inner);
    object& _live() const;

   public:
    /**
     * @throw construction_error if candidate is empty or is not an object, or if its class does
     *  not resolve a cleanup method taking no arguments
     */
    static dynamic_destroyer wrap(value const& candidate);

    template <typename Ty_, REAPER_REQUIRE((std::is_base_of_v<object, Ty_>))>
    static dynamic_destroyer wrap(std::shared_ptr<Ty_> inner)
    {
        return _wrap_object(std::move(inner));
    }

    dynamic_destroyer(dynamic_destroyer&& other) noexcept;
    dynamic_destroyer& operator=(dynamic_destroyer&& other);
    dynamic_destroyer(dynamic_destroyer const&) = delete;
    dynamic_destroyer& operator=(dynamic_destroyer const&) = delete;
    ~dynamic_destroyer() noexcept;

   public:
    value invoke(std::string_view name, arguments args);

    template <typename... Args_>
    value call(std::string_view name, Args_&&... args)
    {
        return invoke(name, pack(std::forward<Args_>(args)...));
    }

    bool isa(std::string_view class_name) const { return _live().isa(class_name); }
    method_entry const* can(std::string_view name) const { return _live().can(name); }

    object& inner() const { return _live(); }

    void release();

    bool is_live() const noexcept { return _inner != nullptr; }
    explicit operator bool() const noexcept { return is_live(); }
};

std::string_view type_of(dynamic_destroyer const&) noexcept;
bool isa(dynamic_destroyer const&, std::string_view class_name) noexcept;
}  // namespace reaper

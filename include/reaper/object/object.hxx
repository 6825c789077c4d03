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
#include <any>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace reaper {
class object;
class class_info;

using value = std::any;
using arguments = std::vector<value>;
using object_ptr = std::shared_ptr<object>;
using class_ptr = std::shared_ptr<class_info const>;

/**
 * Method entry of a class. Always invoked with the object that owns the class as receiver.
 */
using method = std::function<value(object& self, arguments& args)>;

/**
 * Resolved method with the argument count it declares.
 */
struct method_entry {
    static constexpr int any_arity = -1;

    method fn;
    int arity = any_arity;
};

template <typename Ty_>
struct is_object_pointer : std::false_type {
};

template <typename Ty_>
struct is_object_pointer<std::shared_ptr<Ty_>> : std::is_base_of<object, Ty_> {
};

template <typename Ty_>
constexpr bool is_object_pointer_v = is_object_pointer<Ty_>::value;

/**
 * Converts a native value into dynamic representation.
 *
 * Pointers to any object subclass are stored as object_ptr, and C strings as std::string,
 *  so that the receiving side can rely on a single representation.
 */
template <typename Ty_>
value to_value(Ty_&& v)
{
    using value_type = std::decay_t<Ty_>;

    if constexpr (std::is_same_v<value_type, value>)
        return std::forward<Ty_>(v);
    else if constexpr (is_object_pointer_v<value_type>)
        return value{object_ptr{std::forward<Ty_>(v)}};
    else if constexpr (std::is_same_v<value_type, char const*> || std::is_same_v<value_type, char*>)
        return value{std::string{v}};
    else
        return value{std::forward<Ty_>(v)};
}

template <typename... Args_>
arguments pack(Args_&&... args)
{
    arguments packed;
    packed.reserve(sizeof...(Args_));
    (packed.push_back(to_value(std::forward<Args_>(args))), ...);
    return packed;
}

/**
 * Capability set of dynamic objects: a named class with ordered bases and a method table.
 *
 * Instances are immutable once built. Use class_builder to create one.
 */
class class_info
{
   public:
    using method_table = std::map<std::string, method_entry, std::less<>>;

   private:
    std::string _name;
    std::vector<class_ptr> _bases;
    method_table _methods;

   public:
    class_info(std::string name, std::vector<class_ptr> bases, method_table methods);

    std::string const& name() const noexcept { return _name; }
    std::vector<class_ptr> const& bases() const noexcept { return _bases; }

    /**
     * Looks up a method in own table first, then in bases, depth-first and left to right.
     *
     * @return nullptr if no class in the hierarchy defines the method
     */
    method_entry const* resolve(std::string_view name) const noexcept;

    bool isa(std::string_view class_name) const noexcept;
};

/**
 * Base of every dynamically dispatched object.
 */
class object : public std::enable_shared_from_this<object>
{
    class_ptr _class;

   public:
    explicit object(class_ptr klass);
    virtual ~object() = default;

    object(const object&) = delete;
    object(object&&) = delete;
    object& operator=(const object&) = delete;
    object& operator=(object&&) = delete;

   public:
    class_info const& klass() const noexcept { return *_class; }
    std::string const& type_name() const noexcept { return _class->name(); }

    /**
     * Resolves given operation against this object's class, and invokes it with this object
     *  as receiver.
     *
     * @throw no_such_operation if operation is not defined anywhere in the hierarchy
     */
    value invoke(std::string_view name, arguments args);

    template <typename... Args_>
    value call(std::string_view name, Args_&&... args)
    {
        return invoke(name, pack(std::forward<Args_>(args)...));
    }

    bool isa(std::string_view class_name) const noexcept { return _class->isa(class_name); }
    method_entry const* can(std::string_view name) const noexcept { return _class->resolve(name); }
};

inline std::string_view type_of(object const& obj) noexcept { return obj.type_name(); }
inline bool isa(object const& obj, std::string_view class_name) noexcept { return obj.isa(class_name); }

}  // namespace reaper

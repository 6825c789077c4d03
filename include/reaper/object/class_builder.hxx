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
#include <stdexcept>
#include <tuple>
#include <typeinfo>
#include <utility>

#include "../errors.hxx"
#include "../helper/macros.hxx"
#include "object.hxx"

namespace reaper {
namespace _detail {
template <typename... Types>
struct _type_list {
};

template <typename Signature>
struct _callable_decompose;

template <typename Class, typename RetVal, typename Self, typename... Params>
struct _callable_decompose<RetVal (Class::*)(Self, Params...) const> {
    using return_type = RetVal;
    using parameter_list_type = _type_list<Params...>;
};

template <typename Class, typename RetVal, typename Self, typename... Params>
struct _callable_decompose<RetVal (Class::*)(Self, Params...)> {
    using return_type = RetVal;
    using parameter_list_type = _type_list<Params...>;
};

template <typename Param_, typename = void>
struct argument_holder {
    using value_type = std::decay_t<Param_>;
    value_type* ptr = nullptr;

    bool load(value& arg) noexcept { return (ptr = std::any_cast<value_type>(&arg)) != nullptr; }
    Param_&& get() noexcept { return static_cast<Param_&&>(*ptr); }
};

// Declared as value itself; binds whatever the caller passed.
template <typename Param_>
struct argument_holder<Param_, std::enable_if_t<std::is_same_v<std::decay_t<Param_>, value>>> {
    value* ptr = nullptr;

    bool load(value& arg) noexcept
    {
        ptr = &arg;
        return true;
    }
    Param_&& get() noexcept { return static_cast<Param_&&>(*ptr); }
};

// Object pointers travel as object_ptr, thus are down-casted on arrival.
template <typename Param_>
struct argument_holder<Param_, std::enable_if_t<is_object_pointer_v<std::decay_t<Param_>>>> {
    using value_type = std::decay_t<Param_>;
    value_type converted;

    bool load(value& arg)
    {
        if (auto p = std::any_cast<value_type>(&arg)) {
            converted = *p;
            return true;
        }

        if (auto p = std::any_cast<object_ptr>(&arg)) {
            converted = std::dynamic_pointer_cast<typename value_type::element_type>(*p);
            return converted || not *p;
        }

        return false;
    }

    Param_&& get() noexcept { return static_cast<Param_&&>(converted); }
};
}  // namespace _detail

/**
 * Builds class_info for object subclass Ty_
 *
 * @code
 *   auto klass = class_builder<node>{"Node"}
 *                    .extends(tree_class)
 *                    .def("label", &node::label)
 *                    .def("cleanup", &node::cleanup)
 *                    .build();
 * @endcode
 */
template <typename Ty_>
class class_builder
{
    static_assert(std::is_base_of_v<object, Ty_>);

    std::string _name;
    std::vector<class_ptr> _bases;
    class_info::method_table _methods;

   public:
    explicit class_builder(std::string name) : _name(std::move(name)) {}

   public:
    class_builder& extends(class_ptr base)
    {
        if (not base) { throw std::invalid_argument{"null base class for " + _name}; }
        _bases.push_back(std::move(base));
        return *this;
    }

    /**
     * Registers a method that unpacks its own arguments.
     *
     * @param arity declared argument count, or method_entry::any_arity if it accepts any
     */
    class_builder& def_raw(std::string name, method fn, int arity = method_entry::any_arity)
    {
        auto [iter, is_new] = _methods.try_emplace(name, method_entry{std::move(fn), arity});
        if (not is_new) { throw std::logic_error{"method name duplication: " + _name + "::" + name}; }
        return *this;
    }

    template <typename RetVal, typename Class, typename... Params>
    class_builder& def(std::string name, RetVal (Class::*fn)(Params...))
    {
        static_assert(std::is_base_of_v<Class, Ty_>);
        auto invoker = [fn](Ty_& self, Params... args) -> RetVal {
            return (self.*fn)(std::forward<Params>(args)...);
        };
        return _def_typed<RetVal, Params...>(std::move(name), std::move(invoker));
    }

    template <typename RetVal, typename Class, typename... Params>
    class_builder& def(std::string name, RetVal (Class::*fn)(Params...) const)
    {
        static_assert(std::is_base_of_v<Class, Ty_>);
        auto invoker = [fn](Ty_& self, Params... args) -> RetVal {
            return (self.*fn)(std::forward<Params>(args)...);
        };
        return _def_typed<RetVal, Params...>(std::move(name), std::move(invoker));
    }

    /**
     * Callable must take Ty_& as its first parameter.
     */
    template <typename Callable,
              REAPER_REQUIRE(not std::is_member_function_pointer_v<std::decay_t<Callable>>)>
    class_builder& def(std::string name, Callable&& fn)
    {
        using decompose = _detail::_callable_decompose<decltype(&std::decay_t<Callable>::operator())>;
        return _def_callable(std::move(name), std::forward<Callable>(fn),
                             _detail::_type_list<typename decompose::return_type>{},
                             typename decompose::parameter_list_type{});
    }

    class_ptr build()
    {
        return std::make_shared<class_info const>(std::move(_name), std::move(_bases), std::move(_methods));
    }

   private:
    template <typename RetVal, typename Callable, typename... Params>
    class_builder& _def_callable(std::string name, Callable&& fn,
                                _detail::_type_list<RetVal>, _detail::_type_list<Params...>)
    {
        return _def_typed<RetVal, Params...>(std::move(name), std::forward<Callable>(fn));
    }

    template <typename RetVal, typename... Params, typename Callable>
    class_builder& _def_typed(std::string name, Callable&& fn)
    {
        auto fn_method =
                [fn = std::forward<Callable>(fn), name, class_name = _name]  //
                (object& self, arguments& args) mutable -> value {
                    auto receiver = dynamic_cast<Ty_*>(&self);
                    if (not receiver) {
                        argument_error error;
                        error.message("{}::{} invoked on an instance of {}", class_name, name, self.type_name());
                        throw error;
                    }

                    if (args.size() != sizeof...(Params)) {
                        argument_error error;
                        error.message("{}::{} expects {} argument(s), {} given",
                                      class_name, name, sizeof...(Params), args.size());
                        throw error;
                    }

                    return _apply<RetVal, Params...>(fn, *receiver, args, class_name, name,
                                                     std::index_sequence_for<Params...>{});
                };

        return def_raw(std::move(name), std::move(fn_method), static_cast<int>(sizeof...(Params)));
    }

    template <typename RetVal, typename... Params, typename Callable, size_t... Idx_>
    static value _apply(Callable& fn, Ty_& self, arguments& args,
                        std::string const& class_name, std::string const& name,
                        std::index_sequence<Idx_...>)
    {
        std::tuple<_detail::argument_holder<Params>...> holders;

        size_t failed = sizeof...(Params);
        ((failed == sizeof...(Params) && not std::get<Idx_>(holders).load(args[Idx_])
                  ? (void)(failed = Idx_)
                  : (void)0),
         ...);

        if (failed != sizeof...(Params)) {
            argument_error error;
            error.message("{}::{} argument #{} has unexpected type '{}'",
                          class_name, name, failed, args[failed].type().name());
            throw error;
        }

        if constexpr (std::is_void_v<RetVal>) {
            fn(self, std::get<Idx_>(holders).get()...);
            return {};
        } else {
            return to_value(fn(self, std::get<Idx_>(holders).get()...));
        }
    }
};

}  // namespace reaper

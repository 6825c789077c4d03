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

#include "reaper/object/object.hxx"

#include <stdexcept>

#include "reaper/errors.hxx"

namespace reaper {
class_info::class_info(std::string name, std::vector<class_ptr> bases, method_table methods)
        : _name(std::move(name)), _bases(std::move(bases)), _methods(std::move(methods))
{
    if (_name.empty()) { throw std::invalid_argument{"class name must not be empty"}; }
}

method_entry const* class_info::resolve(std::string_view name) const noexcept
{
    if (auto iter = _methods.find(name); iter != _methods.end()) {
        return &iter->second;
    }

    for (auto& base : _bases) {
        if (auto fn = base->resolve(name)) { return fn; }
    }

    return nullptr;
}

bool class_info::isa(std::string_view class_name) const noexcept
{
    if (_name == class_name) { return true; }

    for (auto& base : _bases) {
        if (base->isa(class_name)) { return true; }
    }

    return false;
}

object::object(class_ptr klass) : _class(std::move(klass))
{
    if (not _class) { throw std::invalid_argument{"object requires a class"}; }
}

value object::invoke(std::string_view name, arguments args)
{
    auto fn = _class->resolve(name);
    if (not fn) { throw no_such_operation{std::string{name}, type_name()}; }

    return fn->fn(*this, args);
}
}  // namespace reaper

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

#include "reaper/dynamic_destroyer.hxx"

#include <cstddef>
#include <exception>

#include "reaper/errors.hxx"
#include "reaper/logging.hxx"

namespace reaper {
dynamic_destroyer dynamic_destroyer::wrap(value const& candidate)
{
    if (not candidate.has_value() || candidate.type() == typeid(std::nullptr_t)) {
        throw construction_error{"did not pass reaper::destroyer an object"};
    }

    auto ptr = std::any_cast<object_ptr>(&candidate);
    if (not ptr) {
        construction_error error;
        error.message("did not pass reaper::destroyer an object (got '{}')", candidate.type().name());
        throw error;
    }

    return _wrap_object(*ptr);
}

dynamic_destroyer dynamic_destroyer::_wrap_object(object_ptr inner)
{
    if (not inner) { throw construction_error{"did not pass reaper::destroyer an object"}; }

    auto cleanup = inner->can("cleanup");
    if (not cleanup) {
        construction_error error;
        error.message("reaper::destroyer requires that {} has a cleanup method", inner->type_name());
        throw error;
    }

    if (cleanup->arity > 0) {
        construction_error error;
        error.message("reaper::destroyer requires that {}::cleanup takes no argument, it takes {}",
                      inner->type_name(), cleanup->arity);
        throw error;
    }

    REAPER_TRACE("attached destroyer to {} at {}", inner->type_name(), fmt::ptr(inner.get()));
    return dynamic_destroyer{std::move(inner)};
}

dynamic_destroyer::dynamic_destroyer(dynamic_destroyer&& other) noexcept
        : _inner(std::exchange(other._inner, nullptr))
{
}

dynamic_destroyer& dynamic_destroyer::operator=(dynamic_destroyer&& other)
{
    if (this != &other) {
        release();
        _inner = std::exchange(other._inner, nullptr);
    }

    return *this;
}

dynamic_destroyer::~dynamic_destroyer() noexcept
{
    try {
        release();
    } catch (std::exception& e) {
        REAPER_ERROR("cleanup of wrapped object threw during destruction: {}", e.what());
    } catch (...) {
        REAPER_ERROR("cleanup of wrapped object threw a non-standard exception during destruction");
    }
}

object& dynamic_destroyer::_live() const
{
    if (not _inner) { throw use_after_release{"method call on a released reaper::destroyer"}; }
    return *_inner;
}

value dynamic_destroyer::invoke(std::string_view name, arguments args)
{
    if (name == "cleanup") {
        release();
        return {};
    }

    auto& inner = _live();
    REAPER_TRACE("forwarding {} to {}", name, inner.type_name());

    return inner.invoke(name, std::move(args));
}

void dynamic_destroyer::release()
{
    if (auto inner = std::exchange(_inner, nullptr)) {
        REAPER_DEBUG("releasing {} at {}", inner->type_name(), fmt::ptr(inner.get()));
        inner->invoke("cleanup", {});
    }
}

std::string_view type_of(dynamic_destroyer const&) noexcept
{
    return REAPER_DESTROYER_TYPE_NAME;
}

bool isa(dynamic_destroyer const&, std::string_view class_name) noexcept
{
    return class_name == REAPER_DESTROYER_TYPE_NAME;
}
}  // namespace reaper

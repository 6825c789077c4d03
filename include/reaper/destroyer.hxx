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
#include <exception>
#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "errors.hxx"
#include "helper/macros.hxx"
#include "logging.hxx"

namespace reaper {
REAPER_SFINAE_EXPR(has_cleanup, Ty_, std::declval<Ty_&>().cleanup())

/**
 * Forces cleanup() of an object to run when this handle is released or goes out of scope,
 *  regardless of whether the object is still reachable through an ownership cycle.
 *
 * The destroyer is either used as a standalone handle placed next to the object, or as the
 *  only handle callers get, accessing the object through operator->. cleanup() is invoked at
 *  most once per destroyer, no matter how many times release is triggered.
 *
 * Call cleanup() or release() on the destroyer itself. Calling it through operator->
 *  reaches the object directly, and the destroyer will invoke it once more later.
 *
 * Never store the destroyer itself, or anything owning it, inside the graph it guards.
 */
template <typename Ty_>
class destroyer
{
    static_assert(has_cleanup_v<Ty_>,
                  "reaper::destroyer requires that the wrapped type has a cleanup() method");

   public:
    using element_type = Ty_;
    using pointer = std::shared_ptr<Ty_>;

   private:
    pointer _inner;

   private:
    Ty_* _verify_access() const
    {
        if (not _inner) { throw use_after_release{"access through a released reaper::destroyer"}; }
        return _inner.get();
    }

   public:
    explicit destroyer(pointer inner) : _inner(std::move(inner))
    {
        if (not _inner) { throw construction_error{"did not pass reaper::destroyer an object"}; }
        REAPER_TRACE("attached destroyer to {} at {}", typeid(Ty_).name(), fmt::ptr(_inner.get()));
    }

    destroyer(destroyer&& other) noexcept : _inner(std::exchange(other._inner, nullptr)) {}

    destroyer& operator=(destroyer&& other)
    {
        if (this != &other) {
            release();
            _inner = std::exchange(other._inner, nullptr);
        }

        return *this;
    }

    destroyer(destroyer const&) = delete;
    destroyer& operator=(destroyer const&) = delete;

    ~destroyer() noexcept
    {
        try {
            release();
        } catch (std::exception& e) {
            REAPER_ERROR("cleanup() of {} threw during destruction: {}", typeid(Ty_).name(), e.what());
        } catch (...) {
            REAPER_ERROR("cleanup() of {} threw a non-standard exception during destruction",
                         typeid(Ty_).name());
        }
    }

   public:
    /**
     * Invokes cleanup() of wrapped object if this destroyer is still live, then makes it inert.
     * The destroyer is inert even if cleanup() throws, thus cleanup is never retried.
     */
    void release()
    {
        if (auto inner = std::exchange(_inner, nullptr)) {
            REAPER_DEBUG("releasing {} at {}", typeid(Ty_).name(), fmt::ptr(inner.get()));
            inner->cleanup();
        }
    }

    void cleanup() { release(); }

    bool is_live() const noexcept { return _inner != nullptr; }
    explicit operator bool() const noexcept { return is_live(); }

    Ty_& operator*() const { return *_verify_access(); }
    Ty_* operator->() const { return _verify_access(); }
    Ty_& get() const { return *_verify_access(); }

    /**
     * Shares wrapped object. The returned pointer does not extend the destroyer's duty.
     */
    pointer share() const { return _verify_access(), _inner; }

    /**
     * Capability query answered by the wrapped object's dynamic type.
     */
    template <typename Other_>
    bool is_a() const
    {
        auto inner = _verify_access();

        if constexpr (std::is_polymorphic_v<Ty_>)
            return dynamic_cast<Other_ const*>(inner) != nullptr;
        else
            return std::is_base_of_v<Other_, Ty_> || std::is_same_v<Other_, Ty_>;
    }
};

template <typename Ty_>
destroyer<Ty_> wrap(std::shared_ptr<Ty_> inner)
{
    return destroyer<Ty_>{std::move(inner)};
}

template <typename Ty_, typename... Args_>
destroyer<Ty_> make_destroyer(Args_&&... args)
{
    return destroyer<Ty_>{std::make_shared<Ty_>(std::forward<Args_>(args)...)};
}
}  // namespace reaper

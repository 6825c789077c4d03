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
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <reaper/dynamic_destroyer.hxx>
#include <reaper/object/class_builder.hxx>
#include <reaper/object/object.hxx>

namespace fixture {
reaper::class_ptr const& node_class();
reaper::class_ptr const& leaf_class();
reaper::class_ptr const& session_class();
reaper::class_ptr const& brittle_class();
reaper::class_ptr const& erratic_class();
reaper::class_ptr const& ledger_class();

/**
 * Dynamic node which keeps strong references both ways, thus easily forms cycles.
 */
struct node : reaper::object {
    std::string label;
    std::shared_ptr<node> partner;
    std::vector<reaper::object_ptr> children;
    int* cleanups;

    node(std::string label, int* cleanups)
            : object(node_class()), label(std::move(label)), cleanups(cleanups) {}

    std::string get_label() const { return label; }
    std::string greet(std::string const& whom) const { return label + " greets " + whom; }
    int add(int a, int b) const { return a + b; }
    reaper::object* self() { return this; }

    void adopt(std::shared_ptr<node> child)
    {
        child->partner = std::static_pointer_cast<node>(shared_from_this());
        children.push_back(std::move(child));
    }

    void cleanup()
    {
        ++*cleanups;
        partner.reset();
        children.clear();
    }
};

struct leaf : reaper::object {
    leaf() : object(leaf_class()) {}
    int weight() const { return 7; }
};

/**
 * Always handed out already wrapped. Keeps a reference to itself until cleaned up.
 */
struct session : reaper::object {
    std::string user;
    std::shared_ptr<session> self_ref;
    int* cleanups;

    session(std::string user, int* cleanups)
            : object(session_class()), user(std::move(user)), cleanups(cleanups) {}

    static reaper::dynamic_destroyer open(std::string user, int* cleanups)
    {
        auto instance = std::make_shared<session>(std::move(user), cleanups);
        instance->self_ref = instance;
        return reaper::dynamic_destroyer::wrap(std::move(instance));
    }

    std::string get_user() const { return user; }

    void cleanup()
    {
        ++*cleanups;
        self_ref.reset();
    }
};

struct brittle : reaper::object {
    int attempts = 0;

    brittle() : object(brittle_class()) {}

    void cleanup()
    {
        ++attempts;
        throw std::runtime_error{"brittle cleanup"};
    }
};

// cleanup is registered raw, and throws a value which is not a std::exception.
struct erratic : reaper::object {
    int attempts = 0;
    erratic() : object(erratic_class()) {}
};

struct ledger : reaper::object {
    int closed = 0;

    ledger() : object(ledger_class()) {}
    void cleanup(int code) { closed = code; }
};

inline reaper::class_ptr const& tree_class()
{
    static auto const klass
            = reaper::class_builder<reaper::object>{"Tree"}
                      .def("describe", [](reaper::object& self) { return "tree of " + self.type_name(); })
                      .build();
    return klass;
}

inline reaper::class_ptr const& node_class()
{
    static auto const klass
            = reaper::class_builder<node>{"Node"}
                      .extends(tree_class())
                      .def("label", &node::get_label)
                      .def("greet", &node::greet)
                      .def("add", &node::add)
                      .def("self", &node::self)
                      .def("adopt", &node::adopt)
                      .def("cleanup", &node::cleanup)
                      .def("new", [](node& self, std::string label) {
                          return std::make_shared<node>(std::move(label), self.cleanups);
                      })
                      .build();
    return klass;
}

inline reaper::class_ptr const& leaf_class()
{
    static auto const klass
            = reaper::class_builder<leaf>{"Leaf"}
                      .extends(tree_class())
                      .def("weight", &leaf::weight)
                      .build();
    return klass;
}

inline reaper::class_ptr const& session_class()
{
    static auto const klass
            = reaper::class_builder<session>{"Session"}
                      .extends(tree_class())
                      .def("user", &session::get_user)
                      .def("cleanup", &session::cleanup)
                      .build();
    return klass;
}

inline reaper::class_ptr const& brittle_class()
{
    static auto const klass
            = reaper::class_builder<brittle>{"Brittle"}
                      .def("cleanup", &brittle::cleanup)
                      .build();
    return klass;
}

inline reaper::class_ptr const& erratic_class()
{
    static auto const klass
            = reaper::class_builder<erratic>{"Erratic"}
                      .def_raw(
                              "cleanup",
                              [](reaper::object& self, reaper::arguments&) -> reaper::value {
                                  ++static_cast<erratic&>(self).attempts;
                                  throw 42;
                              },
                              0)
                      .build();
    return klass;
}

inline reaper::class_ptr const& ledger_class()
{
    static auto const klass
            = reaper::class_builder<ledger>{"Ledger"}
                      .def("cleanup", &ledger::cleanup)
                      .build();
    return klass;
}
}  // namespace fixture

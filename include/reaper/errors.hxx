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
#include <string>

#include "helper/exception.hxx"

namespace reaper {
REAPER_DECLARE_EXCEPTION(reaper_error, basic_exception<reaper_error>);

/**
 * Candidate for wrapping is missing, is not an object, or has no cleanup capability.
 */
REAPER_DECLARE_EXCEPTION(construction_error, reaper_error);

/**
 * Forwarded call or direct access through a wrapper which was already released.
 */
REAPER_DECLARE_EXCEPTION(use_after_release, reaper_error);

/**
 * Dynamic call arguments don't match the resolved method's parameter list.
 */
REAPER_DECLARE_EXCEPTION(argument_error, reaper_error);

/**
 * Operation name did not resolve against the receiver's class. The message is identical
 *  whether the call was made on the object itself or through a destroyer.
 */
struct no_such_operation : reaper_error {
   private:
    std::string _operation;
    std::string _type_name;

   public:
    no_such_operation(std::string operation, std::string type_name)
            : reaper_error(fmt::format(R"(Can't locate object method "{}" via package "{}")",
                                       operation, type_name)),
              _operation(std::move(operation)),
              _type_name(std::move(type_name))
    {
    }

    std::string const& operation() const noexcept { return _operation; }
    std::string const& type_name() const noexcept { return _type_name; }
};
}  // namespace reaper

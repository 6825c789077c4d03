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

#include "reaper/logging.hxx"

#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace reaper {
namespace {
std::shared_ptr<spdlog::logger>& logger_instance()
{
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(REAPER_LOGGER_NAME)) { return existing; }
        return spdlog::stdout_color_mt(REAPER_LOGGER_NAME);
    }();

    return instance;
}
}  // namespace

std::shared_ptr<spdlog::logger> const& logger()
{
    return logger_instance();
}

void set_logger(std::shared_ptr<spdlog::logger> logger)
{
    if (not logger) { throw std::invalid_argument{"reaper::set_logger: null logger"}; }
    logger_instance() = std::move(logger);
}
}  // namespace reaper

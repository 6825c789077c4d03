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

#include <memory>
#include <sstream>
#include <stdexcept>

#include <spdlog/sinks/ostream_sink.h>

#include <reaper/reaper.hxx>

#include "fixtures.hxx"

#include <catch2/catch.hpp>

namespace {
struct failing {
    void cleanup() { throw std::runtime_error{"disk on fire"}; }
};

struct quiet {
    void cleanup() {}
};

struct unusual {
    void cleanup() { throw 42; }
};

// Restores the logger which was active on construction.
struct logger_swap {
    std::shared_ptr<spdlog::logger> previous = reaper::logger();

    explicit logger_swap(std::shared_ptr<spdlog::logger> replacement) { reaper::set_logger(std::move(replacement)); }
    ~logger_swap() { reaper::set_logger(previous); }
};
}  // namespace

TEST_CASE("default logger", "[logging]")
{
    REQUIRE(reaper::logger());
    REQUIRE_THROWS_AS(reaper::set_logger(nullptr), std::invalid_argument);
}

TEST_CASE("release events are logged", "[logging]")
{
    std::ostringstream captured;
    auto capture = std::make_shared<spdlog::logger>(
            "reaper-capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
    capture->set_level(spdlog::level::trace);
    capture->set_pattern("%l %v");
    logger_swap restore{capture};

    SECTION("debug on release")
    {
        reaper::make_destroyer<quiet>().release();
        REQUIRE_THAT(captured.str(), Catch::Contains("debug releasing"));

        int cleanups = 0;
        {
            auto wrapper = reaper::dynamic_destroyer::wrap(std::make_shared<fixture::node>("a", &cleanups));
        }
        REQUIRE_THAT(captured.str(), Catch::Contains("releasing Node"));
    }

    SECTION("error on swallowed cleanup failure")
    {
        {
            auto guard = reaper::make_destroyer<failing>();
        }
        REQUIRE_THAT(captured.str(), Catch::Contains("error"));
        REQUIRE_THAT(captured.str(), Catch::Contains("disk on fire"));
    }

    SECTION("error on non-standard cleanup failure")
    {
        {
            auto guard = reaper::make_destroyer<unusual>();
        }
        REQUIRE_THAT(captured.str(), Catch::Contains("error"));
        REQUIRE_THAT(captured.str(), Catch::Contains("non-standard exception"));

        captured.str("");
        {
            auto wrapper = reaper::dynamic_destroyer::wrap(std::make_shared<fixture::erratic>());
        }
        REQUIRE_THAT(captured.str(), Catch::Contains("non-standard exception"));
    }
}

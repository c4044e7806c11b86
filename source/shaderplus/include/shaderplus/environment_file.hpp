#pragma once

#include "shaderplus/environment.hpp"
#include "shaderplus/result.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace shaderplus
{
    // ------------------------------------------------------------
    // Environment file (.spenv)
    //
    // A tiny, line-oriented text format for populating an Environment.
    //
    // Lines:
    //   - Comments start with '#'
    //   - Global value:
    //       set <NAME>=<EXPR>
    //   - Local override:
    //       override <NAME>=<EXPR>
    //
    // EXPR is any shader expression and is evaluated against the
    // environment as built so far, so earlier lines (and the predefined
    // BIT_n values) can be referenced:
    //
    //   set USE_TANGENTS=true
    //   set LIGHT_COUNT=4
    //   set SHADOW_MASK=BIT_0|BIT_3
    //   override LIGHT_COUNT=LIGHT_COUNT*2
    // ------------------------------------------------------------

    Result<void> parse_environment_file(std::string_view text, Environment& env);
    Result<void> load_environment_file(const std::string& filePath, Environment& env);

    // Parses "NAME=EXPR" and evaluates EXPR against env. "NAME" alone yields true.
    Result<std::pair<std::string, Literal>> parse_assignment(std::string_view text, const Environment& env);
} // namespace shaderplus

#pragma once

#include <array>
#include <string_view>

namespace ledgerguard {

namespace patterns {

using namespace std::string_view_literals;

// All entries are lower case; input is lower-cased before matching.
inline constexpr std::array kSqlInjection = {
    // Statement keywords
    "union select"sv, "union all"sv, "select *"sv, "select 1"sv, "select 0"sv,
    "insert into"sv, "update set"sv, "delete from"sv, "drop table"sv,
    "drop database"sv, "create table"sv, "alter table"sv, "exec "sv,
    "execute "sv, "sp_"sv, "xp_"sv,
    // Comments and statement termination
    "--"sv, "/*"sv, "*/"sv, ";--"sv, ";/*"sv, "*/;"sv,
    // Helper functions
    "char("sv, "chr("sv, "ascii("sv, "substring("sv, "concat("sv,
    "waitfor delay"sv, "benchmark("sv, "sleep("sv, "delay("sv,
    // System catalogs
    "information_schema"sv, "sysobjects"sv, "syscolumns"sv, "sys.tables"sv,
    // Always-true conditionals
    " or 1="sv, " or 1=1"sv, " and 1="sv, " and 1=1"sv, " having 1="sv,
    " where 1="sv,
    // Quote termination
    "';"sv, "\";"sv, "';--"sv, "\";--"sv};

inline constexpr std::array kXss = {
    // Tags
    "<script"sv, "</script>"sv, "<iframe"sv, "</iframe>"sv, "<svg onload"sv,
    "<img onerror"sv,
    // URI schemes
    "javascript:"sv, "vbscript:"sv, "data:text/html"sv,
    // Inline event handlers
    "onload="sv, "onerror="sv, "onclick="sv, "onmouseover="sv, "onfocus="sv,
    "onblur="sv, "onkeyup="sv, "onkeydown="sv, "onsubmit="sv, "onchange="sv,
    "onselect="sv, "onreset="sv,
    // Script primitives
    "alert("sv, "confirm("sv, "prompt("sv, "document.cookie"sv,
    "document.write"sv, "window.location"sv, "eval("sv, "expression("sv,
    "url(javascript:"sv,
    // Encoded variants
    "\\x3c"sv, "&#60;"sv, "&lt;script"sv};

} // namespace patterns

/**
 * @brief Heuristic substring classifiers for injection-shaped input.
 *
 * Both checks lower-case a copy of the input and report true on the first
 * listed pattern found. They hold no state and are safe from any thread.
 */
class PatternDetector {
public:
  static bool containsSqlInjection(std::string_view input);
  static bool containsXss(std::string_view input);

  // Either detector matched
  static bool isSuspicious(std::string_view input);
};

} // namespace ledgerguard

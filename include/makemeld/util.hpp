#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace makemeld {

// String helpers
namespace strutil {
  // Strip spaces and tabs (and a stray CR) from both ends
  auto trim(std::string_view str) -> std::string_view;
  auto ltrim(std::string_view str) -> std::string_view;
  auto rtrim(std::string_view str) -> std::string_view;

  // Split on runs of spaces/tabs; empty input yields an empty list
  auto split_ws(std::string_view str) -> std::vector<std::string>;

  // Join with a separator
  auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;

  // True for text made only of spaces, tabs and line breaks
  auto is_blank(std::string_view str) -> bool;
}

}

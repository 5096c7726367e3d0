#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace idtoken::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
std::size_t GetSize(std::string_view name, std::size_t default_value);

}  // namespace idtoken::env

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <charity/encode/error.hpp>

namespace charity::encode {

std::string to_hex( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

} // namespace charity::encode

#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <charity/log/formatter.hpp>
#include <charity/log/frontend.hpp>

namespace charity::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Set the level of the root logger by name (e.g. "debug", "info", "warning").
 * Throws quill::QuillError on an unknown name.
 */
void set_level( std::string_view level );

} // namespace charity::log

#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <charity/encode.hpp>

namespace charity::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace charity::log

template<>
struct fmtquill::formatter< charity::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const charity::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                charity::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< charity::log::hex >: quill::BinaryDataDeferredFormatCodec< charity::log::hex >
{};

#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <deedchain/encode.hpp>

namespace deedchain::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace deedchain::log

template<>
struct fmtquill::formatter< deedchain::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const deedchain::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                deedchain::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< deedchain::log::hex >: quill::BinaryDataDeferredFormatCodec< deedchain::log::hex >
{};

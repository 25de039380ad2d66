#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <mintcap/encode.hpp>

namespace mintcap::log {

struct hex_tag
{};

/**
 * Binary data rendered as 0x-prefixed hex, used for accounts and state ids.
 */
using hex = quill::BinaryData< hex_tag >;

} // namespace mintcap::log

template<>
struct fmtquill::formatter< mintcap::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const mintcap::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                mintcap::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< mintcap::log::hex >: quill::BinaryDataDeferredFormatCodec< mintcap::log::hex >
{};

#include <charity/protocol/origin.hpp>

namespace charity::protocol {

result< account > ensure_signed( const origin& o ) noexcept
{
  if( const auto* s = std::get_if< signed_origin >( &o ); s && s->signer.user() )
    return s->signer;

  return std::unexpected( protocol_errc::bad_origin );
}

result< void > ensure_privileged( const origin& o ) noexcept
{
  if( std::holds_alternative< privileged_origin >( o ) )
    return {};

  return std::unexpected( protocol_errc::bad_origin );
}

} // namespace charity::protocol

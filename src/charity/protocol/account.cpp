#include <charity/protocol/account.hpp>

#include <algorithm>
#include <string_view>
#include <utility>

#include <charity/crypto/hash.hpp>

namespace charity::protocol {

constexpr auto user_account_prefix    = std::byte{ std::to_underlying( account_type::user ) };
constexpr auto program_account_prefix = std::byte{ std::to_underlying( account_type::program ) };

constexpr std::string_view derivation_tag = "modl";

bool account::user() const noexcept
{
  return at( 0 ) == user_account_prefix;
}

bool account::program() const noexcept
{
  return at( 0 ) == program_account_prefix;
}

account_type account::type() const noexcept
{
  switch( std::to_integer< std::uint8_t >( at( 0 ) ) )
  {
    case std::to_underlying( account_type::user ):
      return account_type::user;
    case std::to_underlying( account_type::program ):
      return account_type::program;
    default:
      return account_type::invalid;
  }
}

account user_account( const account_key& key ) noexcept
{
  account a{ user_account_prefix };
  std::ranges::copy( key, a.begin() + 1 );
  return a;
}

account program_account( std::span< const std::byte > identifier ) noexcept
{
  crypto::hasher_reset();
  crypto::hasher_update( derivation_tag );
  crypto::hasher_update( identifier.data(), identifier.size() );
  auto digest = crypto::hasher_finalize();

  account a{ program_account_prefix };
  std::ranges::copy( digest, a.begin() + 1 );
  return a;
}

} // namespace charity::protocol

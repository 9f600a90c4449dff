// NOLINTBEGIN

#include <test/fixture.hpp>

#include <charity/crypto.hpp>
#include <charity/log.hpp>

#include <system_error>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level, std::uint64_t existential_deposit ):
    alice( make_account( "alice" ) ),
    bob( make_account( "bob" ) ),
    carol( make_account( "carol" ) )
{
  charity::log::initialize();
  charity::log::set_level( log_level );

  LOG_INFO( charity::log::instance(), "Opening {} fixture", name );

  _genesis.existential_deposit = existential_deposit;
  _genesis.balances.emplace_back( alice, 100 );
  _genesis.balances.emplace_back( bob, 50 );
  _genesis.balances.emplace_back( carol, 10 );

  _accounts = { alice, bob, carol, charity::pot::account_id( _genesis.pot_identifier ) };

  _controller = std::make_unique< charity::controller::controller >();
  if( auto error = _controller->open( _genesis ); error )
    throw std::system_error( error );
}

fixture::~fixture()
{
  _controller->close();
}

charity::protocol::account fixture::make_account( std::string_view seed )
{
  return charity::protocol::user_account( charity::crypto::hash( seed ) );
}

charity::protocol::origin fixture::make_signed_origin( const charity::protocol::account& signer )
{
  return charity::protocol::signed_origin{ signer };
}

charity::protocol::call fixture::make_donate_call( const charity::protocol::origin& caller,
                                                   std::uint64_t amount ) const
{
  charity::protocol::donate_call c;
  c.caller = caller;
  c.amount = amount;
  return c;
}

charity::protocol::call fixture::make_allocate_call( const charity::protocol::origin& caller,
                                                     const charity::protocol::account& dest,
                                                     std::uint64_t amount ) const
{
  charity::protocol::allocate_call c;
  c.caller = caller;
  c.dest   = dest;
  c.amount = amount;
  return c;
}

charity::protocol::call fixture::make_slash_call( const charity::protocol::account& target,
                                                  std::uint64_t amount ) const
{
  charity::protocol::slash_call c;
  c.target = target;
  c.amount = amount;
  return c;
}

charity::protocol::call fixture::make_charge_fee_call( const charity::protocol::account& payer,
                                                       std::uint64_t amount ) const
{
  charity::protocol::charge_fee_call c;
  c.payer  = payer;
  c.amount = amount;
  return c;
}

bool fixture::verify_conservation() const
{
  std::uint64_t sum = 0;
  for( const auto& account: _accounts )
    sum += _controller->free_balance( account );

  return sum == _controller->total_issuance();
}

} // namespace test

// NOLINTEND

#include <charity/log.hpp>
#include <charity/pot/pot.hpp>

#include <utility>

namespace charity::pot {

protocol::account account_id( const identifier& id ) noexcept
{
  return protocol::program_account( id );
}

ledger::ledger( currency::ledger_interface& currency, chronicler& events, const identifier& id ):
    _currency( currency ),
    _chronicler( events ),
    _account( pot::account_id( id ) )
{}

const protocol::account& ledger::account_id() const noexcept
{
  return _account;
}

std::uint64_t ledger::pot() const noexcept
{
  return _currency.free_balance( _account );
}

std::error_code ledger::initialize()
{
  if( auto error = _currency.ensure_minimum_balance( _account, _currency.minimum_balance() ); error )
  {
    LOG_ERROR( log::instance(),
               "Failed to create pot {}: {}",
               log::hex{ _account.data(), _account.size() },
               error.message() );
    return error;
  }

  LOG_INFO( log::instance(),
            "Created pot {} with balance {}",
            log::hex{ _account.data(), _account.size() },
            pot() );
  return pot_errc::ok;
}

std::error_code ledger::donate( const protocol::origin& origin, std::uint64_t amount )
{
  auto donor = protocol::ensure_signed( origin );
  if( !donor )
    return donor.error();

  if( auto error = _currency.transfer( *donor, _account, amount, currency::existence_requirement::allow_death );
      error )
  {
    LOG_DEBUG( log::instance(),
               "Donation of {} from {} failed: {}",
               amount,
               log::hex{ donor->data(), donor->size() },
               error.message() );

    if( error == currency::currency_errc::insufficient_balance )
      return pot_errc::insufficient_funds;

    return error;
  }

  auto balance = pot();
  LOG_INFO( log::instance(),
            "Received donation of {} from {}, pot balance is {}",
            amount,
            log::hex{ donor->data(), donor->size() },
            balance );

  deposit_event( protocol::donation_received{ *donor, amount, balance }, { *donor, _account } );
  return pot_errc::ok;
}

std::error_code ledger::allocate( const protocol::origin& origin, const protocol::account& dest, std::uint64_t amount )
{
  if( auto privileged = protocol::ensure_privileged( origin ); !privileged )
    return privileged.error();

  if( auto error = _currency.transfer( _account, dest, amount, currency::existence_requirement::allow_death ); error )
  {
    LOG_DEBUG( log::instance(),
               "Allocation of {} to {} failed: {}",
               amount,
               log::hex{ dest.data(), dest.size() },
               error.message() );

    if( error == currency::currency_errc::insufficient_balance )
      return pot_errc::insufficient_pot_funds;

    return error;
  }

  auto balance = pot();
  LOG_INFO( log::instance(),
            "Allocated {} to {}, pot balance is {}",
            amount,
            log::hex{ dest.data(), dest.size() },
            balance );

  deposit_event( protocol::funds_allocated{ dest, amount, balance }, { dest, _account } );
  return pot_errc::ok;
}

std::error_code ledger::absorb( currency::negative_imbalance&& imbalance )
{
  auto amount = imbalance.peek();
  if( !amount )
    return pot_errc::ok;

  if( auto error = _currency.resolve_creating( _account, std::move( imbalance ) ); error )
    return error;

  auto balance = pot();
  LOG_INFO( log::instance(), "Absorbed imbalance of {}, pot balance is {}", amount, balance );

  deposit_event( protocol::imbalance_absorbed{ amount, balance }, { _account } );
  return pot_errc::ok;
}

void ledger::deposit_event( protocol::event_data&& data, std::vector< protocol::account >&& impacted )
{
  protocol::event ev;
  ev.source   = _account;
  ev.data     = std::move( data );
  ev.impacted = std::move( impacted );
  _chronicler.push_event( std::move( ev ) );
}

} // namespace charity::pot

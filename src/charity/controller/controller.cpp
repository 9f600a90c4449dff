#include <charity/controller/controller.hpp>

#include <charity/log.hpp>

#include <algorithm>
#include <utility>
#include <variant>

namespace charity::controller {

controller::controller() = default;

controller::~controller()
{
  close();
}

std::error_code controller::open( const config::genesis& data )
{
  if( _pot )
    return controller_errc::already_open;

  auto balances = std::make_unique< currency::balances >( data.existential_deposit );

  for( const auto& entry: data.balances )
  {
    if( auto error = balances->deposit_creating( entry.account, entry.amount ); error )
    {
      LOG_ERROR( log::instance(),
                 "Invalid genesis balance of {} for {}: {}",
                 entry.amount,
                 log::hex{ entry.account.data(), entry.account.size() },
                 error.message() );
      return error;
    }
  }

  _chronicler.clear();
  auto ledger = std::make_unique< pot::ledger >( *balances, _chronicler, data.pot_identifier );

  if( data.initialize_pot )
    if( auto error = ledger->initialize(); error )
      return error;

  _balances   = std::move( balances );
  _pot        = std::move( ledger );
  _identifier = data.pot_identifier;

  LOG_INFO( log::instance(),
            "Opened ledger with {} account(s) - Existential deposit: {}, Total issuance: {}",
            _balances->account_count(),
            _balances->minimum_balance(),
            _balances->total_issuance() );

  return controller_errc::ok;
}

void controller::close()
{
  _pot.reset();
  _balances.reset();
}

std::error_code controller::apply( const protocol::call& call )
{
  if( !_pot )
    return controller_errc::not_open;

  std::error_code error;

  if( std::holds_alternative< protocol::donate_call >( call ) )
  {
    const auto& donate = std::get< protocol::donate_call >( call );
    error              = _pot->donate( donate.caller, donate.amount );
  }
  else if( std::holds_alternative< protocol::allocate_call >( call ) )
  {
    const auto& allocate = std::get< protocol::allocate_call >( call );
    error                = _pot->allocate( allocate.caller, allocate.dest, allocate.amount );
  }
  else if( std::holds_alternative< protocol::slash_call >( call ) )
  {
    error = apply( std::get< protocol::slash_call >( call ) );
  }
  else if( std::holds_alternative< protocol::charge_fee_call >( call ) )
  {
    error = apply( std::get< protocol::charge_fee_call >( call ) );
  }

  if( error )
    LOG_WARNING( log::instance(), "Call '{}' failed: {}", protocol::call_name( call ), error.message() );

  return error;
}

std::error_code controller::apply( const protocol::slash_call& slash )
{
  auto value = std::min( slash.amount, _balances->free_balance( slash.target ) );
  if( auto error = ensure_absorbable( value ); error )
    return error;

  return _pot->absorb( _balances->slash( slash.target, slash.amount ) );
}

std::error_code controller::apply( const protocol::charge_fee_call& fee )
{
  if( auto error = ensure_absorbable( fee.amount ); error )
    return error;

  auto imbalance = _balances->withdraw( fee.payer, fee.amount, currency::existence_requirement::keep_alive );
  if( !imbalance )
    return imbalance.error();

  return _pot->absorb( std::move( *imbalance ) );
}

std::error_code controller::ensure_absorbable( std::uint64_t value ) const
{
  if( value && !_balances->exists( _pot->account_id() ) && value < _balances->minimum_balance() )
    return currency::currency_errc::existential_deposit;

  return controller_errc::ok;
}

protocol::account controller::pot_account() const noexcept
{
  return pot::account_id( _identifier );
}

std::uint64_t controller::pot_balance() const noexcept
{
  return _pot ? _pot->pot() : 0;
}

std::uint64_t controller::free_balance( const protocol::account& account ) const noexcept
{
  return _balances ? _balances->free_balance( account ) : 0;
}

std::uint64_t controller::total_issuance() const noexcept
{
  return _balances ? _balances->total_issuance() : 0;
}

const std::vector< protocol::event >& controller::events() const noexcept
{
  return _chronicler.events();
}

} // namespace charity::controller

#include <charity/currency/balances.hpp>
#include <charity/log.hpp>

#include <algorithm>
#include <limits>

namespace charity::currency {

balances::balances( std::uint64_t existential_deposit ) noexcept:
    _existential_deposit( existential_deposit )
{}

std::uint64_t balances::minimum_balance() const noexcept
{
  return _existential_deposit;
}

std::uint64_t balances::total_issuance() const noexcept
{
  return _total_issuance;
}

std::uint64_t balances::free_balance( const protocol::account& account ) const noexcept
{
  if( auto it = _accounts.find( account ); it != _accounts.end() )
    return it->second;

  return 0;
}

bool balances::exists( const protocol::account& account ) const noexcept
{
  return _accounts.contains( account );
}

std::size_t balances::account_count() const noexcept
{
  return _accounts.size();
}

bool balances::can_exist( std::uint64_t value ) const noexcept
{
  return value > 0 && value >= _existential_deposit;
}

void balances::set_balance( const protocol::account& account, std::uint64_t value )
{
  if( can_exist( value ) )
  {
    _accounts.insert_or_assign( account, value );
    return;
  }

  if( _accounts.erase( account ) && value )
  {
    LOG_DEBUG( log::instance(),
               "Reaped account {}, burning dust of {}",
               log::hex{ account.data(), account.size() },
               value );
    _total_issuance -= value;
  }
}

std::error_code balances::transfer( const protocol::account& from,
                                    const protocol::account& to,
                                    std::uint64_t value,
                                    existence_requirement requirement )
{
  if( value == 0 || from == to )
    return currency_errc::ok;

  auto from_balance = free_balance( from );

  if( from_balance < value )
    return currency_errc::insufficient_balance;

  auto remaining = from_balance - value;

  if( requirement == existence_requirement::keep_alive && remaining < _existential_deposit )
    return currency_errc::keep_alive;

  auto to_balance = free_balance( to );

  if( std::numeric_limits< std::uint64_t >::max() - value < to_balance )
    return currency_errc::overflow;

  if( !exists( to ) && !can_exist( value ) )
    return currency_errc::existential_deposit;

  set_balance( from, remaining );
  set_balance( to, to_balance + value );

  return currency_errc::ok;
}

std::error_code balances::ensure_minimum_balance( const protocol::account& account, std::uint64_t value )
{
  auto balance = free_balance( account );

  if( balance >= value )
    return currency_errc::ok;

  if( !can_exist( value ) )
    return currency_errc::existential_deposit;

  auto difference = value - balance;

  if( std::numeric_limits< std::uint64_t >::max() - difference < _total_issuance )
    return currency_errc::overflow;

  set_balance( account, value );
  _total_issuance += difference;

  return currency_errc::ok;
}

std::error_code balances::deposit_creating( const protocol::account& account, std::uint64_t value )
{
  if( value == 0 )
    return currency_errc::ok;

  auto balance = free_balance( account );

  if( std::numeric_limits< std::uint64_t >::max() - value < _total_issuance )
    return currency_errc::overflow;

  if( !exists( account ) && !can_exist( value ) )
    return currency_errc::existential_deposit;

  set_balance( account, balance + value );
  _total_issuance += value;

  return currency_errc::ok;
}

std::error_code balances::resolve_creating( const protocol::account& account, negative_imbalance&& imbalance )
{
  auto value = consume( imbalance );

  if( auto error = deposit_creating( account, value ); error )
  {
    LOG_WARNING( log::instance(),
                 "Could not resolve imbalance of {} into {}, burning it: {}",
                 value,
                 log::hex{ account.data(), account.size() },
                 error.message() );
    return error;
  }

  return currency_errc::ok;
}

result< negative_imbalance >
balances::withdraw( const protocol::account& account, std::uint64_t value, existence_requirement requirement )
{
  if( value == 0 )
    return negative_imbalance{};

  auto balance = free_balance( account );

  if( balance < value )
    return std::unexpected( currency_errc::insufficient_balance );

  auto remaining = balance - value;

  if( requirement == existence_requirement::keep_alive && remaining < _existential_deposit )
    return std::unexpected( currency_errc::keep_alive );

  set_balance( account, remaining );
  _total_issuance -= value;

  return negative_imbalance{ value };
}

negative_imbalance balances::slash( const protocol::account& account, std::uint64_t value )
{
  auto balance = free_balance( account );
  auto taken   = std::min( value, balance );

  if( taken == 0 )
    return negative_imbalance{};

  set_balance( account, balance - taken );
  _total_issuance -= taken;

  return negative_imbalance{ taken };
}

} // namespace charity::currency

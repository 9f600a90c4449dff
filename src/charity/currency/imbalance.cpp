#include <charity/currency/error.hpp>
#include <charity/currency/imbalance.hpp>

#include <limits>
#include <utility>

namespace charity::currency {

negative_imbalance::negative_imbalance( std::uint64_t value ) noexcept:
    _value( value )
{}

negative_imbalance::negative_imbalance( negative_imbalance&& other ) noexcept:
    _value( other.release() )
{}

negative_imbalance& negative_imbalance::operator=( negative_imbalance&& other ) noexcept
{
  if( this != &other )
    _value = other.release();

  return *this;
}

std::uint64_t negative_imbalance::peek() const noexcept
{
  return _value;
}

std::error_code negative_imbalance::merge( negative_imbalance&& other ) noexcept
{
  if( std::numeric_limits< std::uint64_t >::max() - other._value < _value )
    return currency_errc::overflow;

  _value += other.release();
  return currency_errc::ok;
}

std::uint64_t negative_imbalance::release() noexcept
{
  return std::exchange( _value, 0 );
}

} // namespace charity::currency

#include <charity/currency/error.hpp>

#include <string>
#include <utility>

namespace charity::currency {

struct _currency_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "currency";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< currency_errc >( condition ) )
    {
      case currency_errc::ok:
        return "ok"s;
      case currency_errc::insufficient_balance:
        return "insufficient balance"s;
      case currency_errc::keep_alive:
        return "transfer would kill account"s;
      case currency_errc::existential_deposit:
        return "value too low to create account"s;
      case currency_errc::overflow:
        return "balance overflow"s;
    }
    std::unreachable();
  }
};

const std::error_category& currency_category() noexcept
{
  static _currency_category category;
  return category;
}

std::error_code make_error_code( currency_errc e )
{
  return std::error_code( static_cast< int >( e ), currency_category() );
}

} // namespace charity::currency

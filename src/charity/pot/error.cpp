#include <charity/pot/error.hpp>

#include <string>
#include <utility>

namespace charity::pot {

struct _pot_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "pot";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< pot_errc >( condition ) )
    {
      case pot_errc::ok:
        return "ok"s;
      case pot_errc::insufficient_funds:
        return "insufficient funds to make donation"s;
      case pot_errc::insufficient_pot_funds:
        return "insufficient pot funds to make allocation"s;
    }
    std::unreachable();
  }
};

const std::error_category& pot_category() noexcept
{
  static _pot_category category;
  return category;
}

std::error_code make_error_code( pot_errc e )
{
  return std::error_code( static_cast< int >( e ), pot_category() );
}

} // namespace charity::pot

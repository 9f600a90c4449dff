#include <charity/protocol/call.hpp>

#include <utility>

namespace charity::protocol {

std::string_view call_name( const call& c ) noexcept
{
  switch( c.index() )
  {
    case 0:
      return "donate";
    case 1:
      return "allocate";
    case 2:
      return "slash";
    case 3:
      return "charge_fee";
  }
  std::unreachable();
}

} // namespace charity::protocol

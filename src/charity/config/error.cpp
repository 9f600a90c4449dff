#include <charity/config/error.hpp>

#include <string>
#include <utility>

namespace charity::config {

struct _config_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "config";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< config_errc >( condition ) )
    {
      case config_errc::ok:
        return "ok"s;
      case config_errc::unreadable_file:
        return "unreadable file"s;
      case config_errc::malformed_document:
        return "malformed document"s;
      case config_errc::missing_field:
        return "missing field"s;
      case config_errc::invalid_account:
        return "invalid account"s;
      case config_errc::invalid_identifier:
        return "invalid identifier"s;
      case config_errc::invalid_origin:
        return "invalid origin"s;
      case config_errc::unknown_call:
        return "unknown call"s;
    }
    std::unreachable();
  }
};

const std::error_category& config_category() noexcept
{
  static _config_category category;
  return category;
}

std::error_code make_error_code( config_errc e )
{
  return std::error_code( static_cast< int >( e ), config_category() );
}

} // namespace charity::config

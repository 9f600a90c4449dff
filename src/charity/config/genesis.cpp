#include <charity/config/genesis.hpp>
#include <charity/encode.hpp>
#include <charity/log.hpp>

#include <algorithm>
#include <string>

#include <boost/algorithm/string/case_conv.hpp>

namespace charity::config {

using namespace std::string_literals;

static result< YAML::Node > require( const YAML::Node& node, const std::string& field )
{
  if( !node.IsMap() || !node[ field ] )
  {
    LOG_ERROR( log::instance(), "Missing required field '{}'", field );
    return std::unexpected( config_errc::missing_field );
  }

  return node[ field ];
}

result< protocol::account > parse_account( std::string_view sv )
{
  auto bytes = encode::from_hex( sv );
  if( !bytes || bytes->size() != protocol::account_key_length + 1 )
    return std::unexpected( config_errc::invalid_account );

  protocol::account account{};
  std::ranges::copy( *bytes, account.begin() );

  if( account.type() == protocol::account_type::invalid )
    return std::unexpected( config_errc::invalid_account );

  return account;
}

result< protocol::origin > parse_origin( std::string_view sv )
{
  auto name = boost::algorithm::to_lower_copy( std::string( sv ) );

  if( name == "root" || name == "privileged" )
    return protocol::privileged_origin{};

  if( name == "system" )
    return protocol::system_origin{};

  if( auto account = parse_account( sv ); account )
    return protocol::signed_origin{ *account };

  return std::unexpected( config_errc::invalid_origin );
}

result< pot::identifier > parse_identifier( std::string_view sv )
{
  if( sv.size() != pot::identifier_length )
    return std::unexpected( config_errc::invalid_identifier );

  pot::identifier id{};
  std::ranges::transform( sv,
                          id.begin(),
                          []( char c )
                          {
                            return static_cast< std::byte >( c );
                          } );
  return id;
}

result< genesis > parse_genesis( const YAML::Node& node )
{
  genesis g;

  try
  {
    if( !node.IsMap() )
      return std::unexpected( config_errc::malformed_document );

    if( node[ "existential_deposit" ] )
      g.existential_deposit = node[ "existential_deposit" ].as< std::uint64_t >();

    if( const auto pot = node[ "pot" ]; pot )
    {
      if( pot[ "identifier" ] )
      {
        auto id = parse_identifier( pot[ "identifier" ].as< std::string >() );
        if( !id )
          return std::unexpected( id.error() );

        g.pot_identifier = *id;
      }

      if( pot[ "initialize" ] )
        g.initialize_pot = pot[ "initialize" ].as< bool >();
    }

    if( const auto balances = node[ "balances" ]; balances )
    {
      if( !balances.IsSequence() )
        return std::unexpected( config_errc::malformed_document );

      for( const auto& entry: balances )
      {
        auto account = require( entry, "account"s );
        if( !account )
          return std::unexpected( account.error() );

        auto amount = require( entry, "amount"s );
        if( !amount )
          return std::unexpected( amount.error() );

        auto parsed = parse_account( account->as< std::string >() );
        if( !parsed )
          return std::unexpected( parsed.error() );

        g.balances.emplace_back( *parsed, amount->as< std::uint64_t >() );
      }
    }
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Malformed genesis data: {}", e.what() );
    return std::unexpected( config_errc::malformed_document );
  }

  return g;
}

result< genesis > load_genesis( const std::filesystem::path& p )
{
  try
  {
    return parse_genesis( YAML::LoadFile( p.string() ) );
  }
  catch( const YAML::BadFile& e )
  {
    LOG_ERROR( log::instance(), "Unable to read genesis data at {}: {}", p.string(), e.what() );
    return std::unexpected( config_errc::unreadable_file );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Malformed genesis data at {}: {}", p.string(), e.what() );
    return std::unexpected( config_errc::malformed_document );
  }
}

static result< protocol::call > parse_call( const YAML::Node& entry )
{
  auto name = require( entry, "call"s );
  if( !name )
    return std::unexpected( name.error() );

  auto amount = require( entry, "amount"s );
  if( !amount )
    return std::unexpected( amount.error() );

  const auto call = name->as< std::string >();
  const auto value = amount->as< std::uint64_t >();

  if( call == "donate" || call == "allocate" )
  {
    auto caller = require( entry, "origin"s );
    if( !caller )
      return std::unexpected( caller.error() );

    auto origin = parse_origin( caller->as< std::string >() );
    if( !origin )
      return std::unexpected( origin.error() );

    if( call == "donate" )
      return protocol::donate_call{ *origin, value };

    auto dest = require( entry, "dest"s );
    if( !dest )
      return std::unexpected( dest.error() );

    auto dest_account = parse_account( dest->as< std::string >() );
    if( !dest_account )
      return std::unexpected( dest_account.error() );

    return protocol::allocate_call{ *origin, *dest_account, value };
  }

  if( call == "slash" || call == "charge_fee" )
  {
    auto target = require( entry, "account"s );
    if( !target )
      return std::unexpected( target.error() );

    auto account = parse_account( target->as< std::string >() );
    if( !account )
      return std::unexpected( account.error() );

    if( call == "slash" )
      return protocol::slash_call{ *account, value };

    return protocol::charge_fee_call{ *account, value };
  }

  LOG_ERROR( log::instance(), "Unknown call '{}'", call );
  return std::unexpected( config_errc::unknown_call );
}

result< std::vector< protocol::call > > parse_calls( const YAML::Node& node )
{
  std::vector< protocol::call > calls;

  try
  {
    const auto entries = node.IsSequence() ? node : node[ "calls" ];
    if( !entries.IsSequence() )
      return std::unexpected( config_errc::malformed_document );

    for( const auto& entry: entries )
    {
      auto c = parse_call( entry );
      if( !c )
        return std::unexpected( c.error() );

      calls.emplace_back( std::move( *c ) );
    }
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Malformed call list: {}", e.what() );
    return std::unexpected( config_errc::malformed_document );
  }

  return calls;
}

result< std::vector< protocol::call > > load_calls( const std::filesystem::path& p )
{
  try
  {
    return parse_calls( YAML::LoadFile( p.string() ) );
  }
  catch( const YAML::BadFile& e )
  {
    LOG_ERROR( log::instance(), "Unable to read call list at {}: {}", p.string(), e.what() );
    return std::unexpected( config_errc::unreadable_file );
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( log::instance(), "Malformed call list at {}: {}", p.string(), e.what() );
    return std::unexpected( config_errc::malformed_document );
  }
}

} // namespace charity::config

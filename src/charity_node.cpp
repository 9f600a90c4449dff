#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <charity/config.hpp>
#include <charity/controller.hpp>
#include <charity/log.hpp>
#include <charity/protocol.hpp>

namespace constants {

using namespace std::string_literals;

const auto help_option               = "help,h"s;
const auto version_option            = "version,v"s;
const auto basedir_option            = "basedir,d"s;
const auto basedir_default           = "."s;
const auto log_level_option          = "log-level,l"s;
const auto log_level_default         = "info"s;
const auto genesis_data_file_option  = "genesis-data,g"s;
const auto genesis_data_file_default = "genesis.yml"s;
const auto calls_file_option         = "calls,c"s;
const auto calls_file_default        = ""s;
const auto service_name              = "charity"s;

} // namespace constants

using namespace boost;
using namespace charity;

const std::string& version_string();

int main( int argc, char** argv )
{
  std::string log_level;
  std::filesystem::path basedir, genesis_data_file, calls_file;

  log::initialize();

  try
  {
    program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()             , "Print this help message and exit" )
      ( constants::version_option.data()          , "Print version string and exit" )
      ( constants::basedir_option.data()          , program_options::value< std::string >()->default_value( constants::basedir_default ), "Charity base directory" )
      ( constants::log_level_option.data()        , program_options::value< std::string >(), "The log filtering level" )
      ( constants::genesis_data_file_option.data(), program_options::value< std::string >(), "The genesis data file (absolute path or relative to basedir)" )
      ( constants::calls_file_option.data()       , program_options::value< std::string >(), "A list of calls to apply after genesis (absolute path or relative to basedir)" );
    // clang-format on

    program_options::variables_map args;
    program_options::store( program_options::parse_command_line( argc, argv, options ), args );

    if( args.count( "help" ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::cout << version_string() << "\n";
      return EXIT_SUCCESS;
    }

    basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node charity_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
    {
      yaml_config = basedir / "config.yaml";
    }

    if( std::filesystem::exists( yaml_config ) )
    {
      config         = YAML::LoadFile( yaml_config.string() );
      global_config  = config[ "global" ];
      charity_config = config[ constants::service_name ];
    }

    // clang-format off
    log_level         = config::get_option< std::string >( constants::log_level_option, constants::log_level_default, args, charity_config, global_config );
    genesis_data_file = std::filesystem::path( config::get_option< std::string >( constants::genesis_data_file_option, constants::genesis_data_file_default, args, charity_config, global_config ) );
    calls_file        = std::filesystem::path( config::get_option< std::string >( constants::calls_file_option, constants::calls_file_default, args, charity_config, global_config ) );
    // clang-format on

    log::set_level( log_level );

    LOG_INFO( log::instance(), "{}", version_string() );

    if( config.IsNull() )
    {
      LOG_WARNING( log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );
    }

    if( genesis_data_file.is_relative() )
      genesis_data_file = basedir / genesis_data_file;

    if( !calls_file.empty() && calls_file.is_relative() )
      calls_file = basedir / calls_file;
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( log::instance(), "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  auto genesis = config::load_genesis( genesis_data_file );
  if( !genesis )
  {
    LOG_ERROR( log::instance(),
               "Unable to load genesis data from {}: {}",
               genesis_data_file.string(),
               genesis.error().message() );
    return EXIT_FAILURE;
  }

  std::vector< protocol::call > calls;
  if( !calls_file.empty() )
  {
    auto loaded = config::load_calls( calls_file );
    if( !loaded )
    {
      LOG_ERROR( log::instance(), "Unable to load calls from {}: {}", calls_file.string(), loaded.error().message() );
      return EXIT_FAILURE;
    }

    calls = std::move( *loaded );
  }

  controller::controller controller;

  if( auto error = controller.open( *genesis ); error )
  {
    LOG_ERROR( log::instance(), "Unable to open controller: {}", error.message() );
    return EXIT_FAILURE;
  }

  const auto pot = controller.pot_account();
  LOG_INFO( log::instance(), "Pot account: {}", log::hex{ pot.data(), pot.size() } );

  std::size_t applied = 0;
  for( const auto& call: calls )
  {
    if( !controller.apply( call ) )
      ++applied;
  }

  if( !calls.empty() )
    LOG_INFO( log::instance(), "Applied {} of {} call(s)", applied, calls.size() );

  for( const auto& ev: controller.events() )
  {
    LOG_INFO( log::instance(),
              "Event #{} {} - Pot balance: {}",
              ev.sequence,
              protocol::event_name( ev.data ),
              std::visit(
                []( const auto& data )
                {
                  return data.pot_balance;
                },
                ev.data ) );
  }

  LOG_INFO( log::instance(),
            "Pot balance: {}, Total issuance: {}",
            controller.pot_balance(),
            controller.total_issuance() );

  controller.close();

  LOG_INFO( log::instance(), "Shut down gracefully" );

  return EXIT_SUCCESS;
}

const std::string& version_string()
{
  static std::string v_str = "Charity Node v" + std::to_string( PROJECT_MAJOR_VERSION ) + "."
                             + std::to_string( PROJECT_MINOR_VERSION ) + "."
                             + std::to_string( PROJECT_PATCH_VERSION );
  return v_str;
}

#pragma once

#include <optional>
#include <string>

#include <boost/program_options.hpp>
#include <yaml-cpp/yaml.h>

namespace charity::config {

/**
 * Look up an option, first on the command line, then in each config section
 * in the order given, falling back to the default.
 *
 * Keys may carry a short form ("log-level,l"), only the long name is used for
 * the lookup.
 */
template< typename T, typename... Sections >
T get_option( const std::string& key,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const Sections&... sections )
{
  const auto name = key.substr( 0, key.find( ',' ) );

  if( args.count( name ) )
    return args[ name ].template as< T >();

  std::optional< T > value;

  (
    [ & ]
    {
      if( !value && sections.IsMap() && sections[ name ] )
        value = sections[ name ].template as< T >();
    }(),
    ... );

  return value.value_or( default_value );
}

} // namespace charity::config

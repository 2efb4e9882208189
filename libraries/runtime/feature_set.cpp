#include <mollusk/runtime/exceptions.hpp>
#include <mollusk/runtime/feature_set.hpp>

#include <algorithm>

namespace mollusk::runtime {

const std::vector< std::string >& feature_set::known_features()
{
   static const std::vector< std::string > features = {
      feature::return_data_syscalls,
      feature::clock_sysvar_syscall,
      feature::cross_program_invocation
   };

   return features;
}

feature_set feature_set::all_enabled()
{
   feature_set fs;
   for ( const auto& f : known_features() )
      fs._active.insert( f );
   return fs;
}

void feature_set::activate( const std::string& name )
{
   const auto& known = known_features();
   MOLLUSK_ASSERT( std::find( known.begin(), known.end(), name ) != known.end(), unknown_feature_exception, "unknown feature '${f}'", ("f", name) );
   _active.insert( name );
}

void feature_set::deactivate( const std::string& name )
{
   _active.erase( name );
}

bool feature_set::is_active( const std::string& name ) const
{
   return _active.count( name ) > 0;
}

const std::set< std::string >& feature_set::active() const
{
   return _active;
}

} // mollusk::runtime

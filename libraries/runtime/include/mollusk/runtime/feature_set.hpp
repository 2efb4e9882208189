#pragma once

#include <set>
#include <string>
#include <vector>

namespace mollusk::runtime {

namespace feature {

constexpr const char* return_data_syscalls     = "return_data_syscalls";
constexpr const char* clock_sysvar_syscall     = "clock_sysvar_syscall";
constexpr const char* cross_program_invocation = "cross_program_invocation";

} // feature

/**
 * The set of active runtime features. A default constructed set has nothing
 * active.
 */
class feature_set
{
   public:
      static feature_set all_enabled();
      static const std::vector< std::string >& known_features();

      void activate( const std::string& name );
      void deactivate( const std::string& name );
      bool is_active( const std::string& name ) const;

      const std::set< std::string >& active() const;

   private:
      std::set< std::string > _active;
};

} // mollusk::runtime

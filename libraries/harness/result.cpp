#include <mollusk/harness/result.hpp>
#include <mollusk/util.hpp>

#include <algorithm>

namespace mollusk {

bool is_success( const program_result& r )
{
   return std::holds_alternative< program_success >( r );
}

std::string to_string( const program_result& r )
{
   return std::visit( overloaded {
      []( const program_success& ) -> std::string
      {
         return "success";
      },
      []( const program_failure& f ) -> std::string
      {
         return "failure: " + runtime::to_string( f.error );
      },
      []( const program_unknown_error& u ) -> std::string
      {
         std::string s = "unknown error: " + runtime::to_string( u.error );
         if ( u.vm_error )
            s += " (" + *u.vm_error + ")";
         return s;
      }
   }, r );
}

std::ostream& operator<<( std::ostream& os, const program_result& r )
{
   return os << to_string( r );
}

const account* instruction_result::get_account( const pubkey& key ) const
{
   auto it = std::find_if( resulting_accounts.begin(), resulting_accounts.end(), [&]( const keyed_account& ka )
   {
      return ka.first == key;
   } );

   return it == resulting_accounts.end() ? nullptr : &it->second;
}

} // mollusk

#include <mollusk/runtime/exceptions.hpp>

namespace mollusk::runtime {

instruction_error error_of( const instruction_exception& e )
{
   return instruction_error( e.get_code() );
}

uint32_t custom_code_of( const instruction_exception& e )
{
   const auto& j = e.get_json();
   auto it = j.find( "custom_code" );
   if ( it == j.end() || !it->is_number_unsigned() )
      return 0;

   return it->get< uint32_t >();
}

} // mollusk::runtime

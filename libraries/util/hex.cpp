#include <mollusk/util/binary.hpp>

namespace mollusk::util {

std::string to_hex( const std::vector< uint8_t >& v )
{
   static const char* const digits = "0123456789abcdef";

   std::string s;
   s.reserve( v.size() * 2 );
   for ( auto b : v )
   {
      s += digits[ b >> 4 ];
      s += digits[ b & 0x0f ];
   }

   return s;
}

} // mollusk::util

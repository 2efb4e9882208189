#include <mollusk/crypto/ed25519.hpp>

#include <boost/multiprecision/cpp_int.hpp>

namespace mollusk::crypto {

using boost::multiprecision::cpp_int;

namespace {

const cpp_int& field_prime()
{
   static const cpp_int p = ( cpp_int( 1 ) << 255 ) - 19;
   return p;
}

// d = -121665 / 121666 mod p
const cpp_int& edwards_d()
{
   static const cpp_int d = []()
   {
      const auto& p = field_prime();
      cpp_int inv = boost::multiprecision::powm( cpp_int( 121666 ), cpp_int( p - 2 ), p );
      return cpp_int( ( ( p - 121665 ) * inv ) % p );
   }();
   return d;
}

} // anonymous

bool is_on_ed25519_curve( const std::array< uint8_t, 32 >& compressed )
{
   const auto& p = field_prime();

   auto y_bytes = compressed;
   y_bytes[ 31 ] &= 0x7f;

   cpp_int y;
   boost::multiprecision::import_bits( y, y_bytes.rbegin(), y_bytes.rend() );
   y %= p;

   cpp_int yy = ( y * y ) % p;
   cpp_int u  = ( yy + p - 1 ) % p;
   cpp_int v  = ( edwards_d() * yy + 1 ) % p;

   // v is never zero because -1/d is not a square
   cpp_int w = ( u * cpp_int( boost::multiprecision::powm( v, cpp_int( p - 2 ), p ) ) ) % p;
   if ( w == 0 )
      return true;

   cpp_int euler = boost::multiprecision::powm( w, cpp_int( ( p - 1 ) / 2 ), p );
   return euler == 1;
}

} // mollusk::crypto

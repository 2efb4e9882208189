#include <mollusk/util/base58.hpp>

#include <array>

namespace mollusk::util {

namespace {

const char* const alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int8_t digit_value( char c )
{
   static const auto table = []()
   {
      std::array< int8_t, 256 > t;
      t.fill( -1 );
      for ( int8_t i = 0; i < 58; i++ )
         t[ uint8_t( alphabet[ i ] ) ] = i;
      return t;
   }();

   return table[ uint8_t( c ) ];
}

} // anonymous

std::string encode_base58( const uint8_t* begin, const uint8_t* end )
{
   std::size_t zeroes = 0;
   while ( begin != end && *begin == 0 )
   {
      ++begin;
      ++zeroes;
   }

   // log(256) / log(58), rounded up
   std::vector< uint8_t > b58( std::size_t( end - begin ) * 138 / 100 + 1 );
   std::size_t length = 0;

   for ( ; begin != end; ++begin )
   {
      uint32_t carry = *begin;
      std::size_t i = 0;
      for ( auto it = b58.rbegin(); ( carry != 0 || i < length ) && it != b58.rend(); ++it, ++i )
      {
         carry += 256 * uint32_t( *it );
         *it = uint8_t( carry % 58 );
         carry /= 58;
      }
      length = i;
   }

   auto it = b58.begin() + ( b58.size() - length );

   std::string result;
   result.reserve( zeroes + length );
   result.assign( zeroes, '1' );
   for ( ; it != b58.end(); ++it )
      result += alphabet[ *it ];

   return result;
}

std::string encode_base58( const std::vector< uint8_t >& v )
{
   return encode_base58( v.data(), v.data() + v.size() );
}

bool decode_base58( const std::string& s, std::vector< uint8_t >& out )
{
   auto p = s.begin();
   std::size_t zeroes = 0;
   while ( p != s.end() && *p == '1' )
   {
      ++zeroes;
      ++p;
   }

   // log(58) / log(256), rounded up
   std::vector< uint8_t > b256( std::size_t( s.end() - p ) * 733 / 1000 + 1 );
   std::size_t length = 0;

   for ( ; p != s.end(); ++p )
   {
      auto value = digit_value( *p );
      if ( value < 0 )
         return false;

      uint32_t carry = uint32_t( value );
      std::size_t i = 0;
      for ( auto it = b256.rbegin(); ( carry != 0 || i < length ) && it != b256.rend(); ++it, ++i )
      {
         carry += 58 * uint32_t( *it );
         *it = uint8_t( carry % 256 );
         carry /= 256;
      }
      length = i;
   }

   auto it = b256.begin() + ( b256.size() - length );

   out.assign( zeroes, 0x00 );
   out.insert( out.end(), it, b256.end() );
   return true;
}

} // mollusk::util

#include <mollusk/runtime/address.hpp>
#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/exceptions.hpp>

#include <mollusk/crypto/ed25519.hpp>
#include <mollusk/crypto/hash.hpp>

#include <string>

namespace mollusk::runtime {

namespace {

const std::string pda_marker = "ProgramDerivedAddress";

} // anonymous

pubkey create_program_address( const seed_list& seeds, const pubkey& program_id )
{
   MOLLUSK_ASSERT( seeds.size() <= constants::max_seeds, max_seed_length_exceeded_exception,
      "at most ${m} seeds are allowed, got ${n}", ("m", constants::max_seeds)("n", seeds.size()) );

   crypto::encoder enc;
   for ( const auto& seed : seeds )
   {
      MOLLUSK_ASSERT( seed.size() <= constants::max_seed_length, max_seed_length_exceeded_exception,
         "seed length ${l} exceeds the maximum of ${m}", ("l", seed.size())("m", constants::max_seed_length) );
      enc.write( seed );
   }

   enc.write( program_id.bytes() );
   enc.write( pda_marker );

   auto digest = enc.get_result();
   MOLLUSK_ASSERT( !crypto::is_on_ed25519_curve( digest ), invalid_seeds_exception, "derived address is on the ed25519 curve" );

   return pubkey( digest );
}

std::pair< pubkey, uint8_t > find_program_address( const seed_list& seeds, const pubkey& program_id )
{
   seed_list with_bump = seeds;
   with_bump.push_back( { 0 } );

   for ( int bump = 255; bump >= 0; bump-- )
   {
      with_bump.back()[ 0 ] = uint8_t( bump );

      try
      {
         return { create_program_address( with_bump, program_id ), uint8_t( bump ) };
      }
      catch ( const invalid_seeds_exception& )
      {
         // On the curve, try the next bump
      }
   }

   MOLLUSK_THROW( invalid_seeds_exception, "unable to find a viable program address bump seed" );
}

} // mollusk::runtime

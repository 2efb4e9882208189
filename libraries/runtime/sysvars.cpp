#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/sysvars.hpp>

namespace mollusk::runtime {

namespace {

uint64_t next_power_of_two( uint64_t v )
{
   uint64_t p = 1;
   while ( p < v )
      p <<= 1;
   return p;
}

uint64_t trailing_zeros( uint64_t v )
{
   if ( v == 0 )
      return 64;

   uint64_t n = 0;
   while ( ( v & 1 ) == 0 )
   {
      v >>= 1;
      n++;
   }
   return n;
}

} // anonymous

uint64_t rent::minimum_balance( uint64_t data_len ) const
{
   uint64_t bytes = constants::account_storage_overhead + data_len;
   return uint64_t( double( bytes * lamports_per_byte_year ) * exemption_threshold );
}

epoch_schedule epoch_schedule::custom( uint64_t slots_per_epoch, uint64_t leader_schedule_slot_offset, bool warmup )
{
   epoch_schedule s;
   s.slots_per_epoch = slots_per_epoch < minimum_slots_per_epoch ? minimum_slots_per_epoch : slots_per_epoch;
   s.leader_schedule_slot_offset = leader_schedule_slot_offset;
   s.warmup = warmup;

   if ( warmup )
   {
      s.first_normal_epoch = trailing_zeros( next_power_of_two( s.slots_per_epoch ) ) - trailing_zeros( minimum_slots_per_epoch );
      s.first_normal_slot = ( ( uint64_t( 1 ) << s.first_normal_epoch ) - 1 ) * minimum_slots_per_epoch;
   }
   else
   {
      s.first_normal_epoch = 0;
      s.first_normal_slot = 0;
   }

   return s;
}

std::pair< uint64_t, uint64_t > epoch_schedule::get_epoch_and_slot_index( uint64_t slot ) const
{
   if ( slot < first_normal_slot )
   {
      uint64_t epoch = trailing_zeros( next_power_of_two( slot + minimum_slots_per_epoch + 1 ) )
         - trailing_zeros( minimum_slots_per_epoch ) - 1;

      uint64_t epoch_len = uint64_t( 1 ) << ( epoch + trailing_zeros( minimum_slots_per_epoch ) );
      return { epoch, slot - ( epoch_len - minimum_slots_per_epoch ) };
   }

   uint64_t normal_slot_index = slot - first_normal_slot;
   uint64_t normal_epoch_index = normal_slot_index / slots_per_epoch;
   return { first_normal_epoch + normal_epoch_index, normal_slot_index % slots_per_epoch };
}

uint64_t epoch_schedule::get_epoch( uint64_t slot ) const
{
   return get_epoch_and_slot_index( slot ).first;
}

uint64_t epoch_schedule::get_first_slot_in_epoch( uint64_t epoch ) const
{
   if ( epoch <= first_normal_epoch )
      return ( ( uint64_t( 1 ) << epoch ) - 1 ) * minimum_slots_per_epoch;

   return ( epoch - first_normal_epoch ) * slots_per_epoch + first_normal_slot;
}

uint64_t epoch_schedule::get_slots_in_epoch( uint64_t epoch ) const
{
   if ( epoch < first_normal_epoch )
      return uint64_t( 1 ) << ( epoch + trailing_zeros( minimum_slots_per_epoch ) );

   return slots_per_epoch;
}

uint64_t epoch_schedule::get_leader_schedule_epoch( uint64_t slot ) const
{
   if ( slot < first_normal_slot )
      return get_epoch_and_slot_index( slot ).first + 1;

   uint64_t new_slots_since_first_normal_slot = slot - first_normal_slot;
   uint64_t new_first_normal_leader_schedule_slot = new_slots_since_first_normal_slot + leader_schedule_slot_offset;
   uint64_t new_epochs_since_first_normal_leader_schedule = new_first_normal_leader_schedule_slot / slots_per_epoch;
   return first_normal_epoch + new_epochs_since_first_normal_leader_schedule;
}

void sysvars::warp_to_slot( uint64_t slot )
{
   runtime::clock c;
   c.slot = slot;
   c.epoch = epoch_schedule.get_epoch( slot );
   c.leader_schedule_epoch = epoch_schedule.get_leader_schedule_epoch( slot );
   clock = c;
}

} // mollusk::runtime

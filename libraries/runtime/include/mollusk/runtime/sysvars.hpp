#pragma once

#include <cstdint>
#include <utility>

namespace mollusk::runtime {

struct clock
{
   uint64_t slot                  = 0;
   int64_t  epoch_start_timestamp = 0;
   uint64_t epoch                 = 0;
   uint64_t leader_schedule_epoch = 0;
   int64_t  unix_timestamp        = 0;

   bool operator==( const clock& o ) const
   {
      return slot == o.slot && epoch_start_timestamp == o.epoch_start_timestamp && epoch == o.epoch
         && leader_schedule_epoch == o.leader_schedule_epoch && unix_timestamp == o.unix_timestamp;
   }
};

struct rent
{
   uint64_t lamports_per_byte_year = 3480;
   double   exemption_threshold    = 2.0;
   uint8_t  burn_percent           = 50;

   /**
    * Minimum balance for an account holding data_len bytes to be rent exempt.
    */
   uint64_t minimum_balance( uint64_t data_len ) const;
};

/**
 * Epoch lengths. With warmup, epochs start at minimum_slots_per_epoch slots
 * and double until they reach slots_per_epoch at first_normal_epoch.
 */
struct epoch_schedule
{
   static constexpr uint64_t minimum_slots_per_epoch = 32;

   uint64_t slots_per_epoch             = 432000;
   uint64_t leader_schedule_slot_offset = 432000;
   bool     warmup                      = true;
   uint64_t first_normal_epoch          = 14;
   uint64_t first_normal_slot           = 524256;

   static epoch_schedule custom( uint64_t slots_per_epoch, uint64_t leader_schedule_slot_offset, bool warmup );

   uint64_t get_epoch( uint64_t slot ) const;
   std::pair< uint64_t, uint64_t > get_epoch_and_slot_index( uint64_t slot ) const;
   uint64_t get_first_slot_in_epoch( uint64_t epoch ) const;
   uint64_t get_slots_in_epoch( uint64_t epoch ) const;
   uint64_t get_leader_schedule_epoch( uint64_t slot ) const;
};

struct sysvars
{
   runtime::clock          clock;
   runtime::rent           rent;
   runtime::epoch_schedule epoch_schedule;

   /**
    * Move the clock to slot. The result depends only on slot and the epoch
    * schedule.
    */
   void warp_to_slot( uint64_t slot );
};

} // mollusk::runtime

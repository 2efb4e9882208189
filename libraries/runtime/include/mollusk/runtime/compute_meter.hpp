#pragma once

#include <cstdint>

namespace mollusk::runtime {

namespace compute_cost {
   constexpr uint64_t system_program = 150;
   constexpr uint64_t loader         = 570;
}

/**
 * Compute units remaining to an instruction and its nested invocations.
 */
class compute_meter final
{
public:
   explicit compute_meter( uint64_t limit = 0 );
   ~compute_meter();

   void reset( uint64_t limit );

   /**
    * Consume units. When fewer than units remain the meter is drained and
    * computational_budget_exceeded_exception is thrown.
    */
   void consume( uint64_t units );

   uint64_t limit() const;
   uint64_t remaining() const;
   uint64_t used() const;

private:
   uint64_t _limit     = 0;
   uint64_t _remaining = 0;
};

} // mollusk::runtime

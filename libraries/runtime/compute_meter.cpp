#include <mollusk/runtime/compute_meter.hpp>
#include <mollusk/runtime/exceptions.hpp>

namespace mollusk::runtime {

compute_meter::compute_meter( uint64_t limit )
{
   reset( limit );
}

compute_meter::~compute_meter() = default;

void compute_meter::reset( uint64_t limit )
{
   _limit     = limit;
   _remaining = limit;
}

void compute_meter::consume( uint64_t units )
{
   if ( units > _remaining )
   {
      _remaining = 0;
      MOLLUSK_THROW( computational_budget_exceeded_exception, "compute budget of ${l} units exceeded", ("l", _limit) );
   }

   _remaining -= units;
}

uint64_t compute_meter::limit() const
{
   return _limit;
}

uint64_t compute_meter::remaining() const
{
   return _remaining;
}

uint64_t compute_meter::used() const
{
   return _limit - _remaining;
}

} // mollusk::runtime

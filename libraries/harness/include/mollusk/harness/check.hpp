#pragma once

#include <mollusk/harness/result.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mollusk {

struct program_result_check
{
   program_result expected;
};

struct compute_units_check
{
   uint64_t units = 0;
};

struct account_predicate
{
   std::string                              description;
   std::function< bool( const account& ) > fn;
};

/**
 * Expected state of one resulting account. Unset fields are not checked.
 */
struct account_check
{
   pubkey                                  key;
   std::optional< uint64_t >               lamports;
   std::optional< std::vector< uint8_t > > data;
   std::optional< pubkey >                 owner;
   std::optional< bool >                   executable;
   std::optional< std::size_t >            space;
   std::optional< uint64_t >               rent_epoch;
   std::vector< account_predicate >        predicates;
};

struct return_data_check
{
   std::vector< uint8_t > data;
};

using check = std::variant< program_result_check, compute_units_check, account_check, return_data_check >;

class account_check_builder
{
   public:
      explicit account_check_builder( const pubkey& key );

      account_check_builder& lamports( uint64_t l );
      account_check_builder& data( const std::vector< uint8_t >& d );
      account_check_builder& owner( const pubkey& o );
      account_check_builder& executable( bool e );
      account_check_builder& space( std::size_t s );
      account_check_builder& rent_epoch( uint64_t e );
      account_check_builder& predicate( const std::string& description, std::function< bool( const account& ) > fn );

      check build() const;

   private:
      account_check _check;
};

namespace checks {

check success();
check err( const program_error& e );
check instruction_err( instruction_error e );
check compute_units( uint64_t units );
account_check_builder account( const pubkey& key );
check return_data( const std::vector< uint8_t >& data );

} // checks

/**
 * Evaluate every check against result and describe each one that fails.
 * Passing checks contribute nothing.
 */
std::vector< std::string > evaluate_checks( const instruction_result& result, const std::vector< check >& checks );

/**
 * Evaluate every check and throw check_failure_exception listing all failures.
 */
void run_checks( const instruction_result& result, const std::vector< check >& checks );

} // mollusk

#include <mollusk/harness/check.hpp>
#include <mollusk/harness/exceptions.hpp>

#include <mollusk/log.hpp>
#include <mollusk/util.hpp>
#include <mollusk/util/binary.hpp>

#include <sstream>

namespace mollusk {

/*
 * Account check builder
 */

account_check_builder::account_check_builder( const pubkey& key )
{
   _check.key = key;
}

account_check_builder& account_check_builder::lamports( uint64_t l )
{
   _check.lamports = l;
   return *this;
}

account_check_builder& account_check_builder::data( const std::vector< uint8_t >& d )
{
   _check.data = d;
   return *this;
}

account_check_builder& account_check_builder::owner( const pubkey& o )
{
   _check.owner = o;
   return *this;
}

account_check_builder& account_check_builder::executable( bool e )
{
   _check.executable = e;
   return *this;
}

account_check_builder& account_check_builder::space( std::size_t s )
{
   _check.space = s;
   return *this;
}

account_check_builder& account_check_builder::rent_epoch( uint64_t e )
{
   _check.rent_epoch = e;
   return *this;
}

account_check_builder& account_check_builder::predicate( const std::string& description, std::function< bool( const account& ) > fn )
{
   _check.predicates.push_back( account_predicate{ description, std::move( fn ) } );
   return *this;
}

check account_check_builder::build() const
{
   return _check;
}

/*
 * Check constructors
 */

namespace checks {

check success()
{
   return program_result_check{ program_success{} };
}

check err( const program_error& e )
{
   return program_result_check{ program_failure{ e } };
}

check instruction_err( instruction_error e )
{
   if ( auto pe = runtime::to_program_error( e ) )
      return program_result_check{ program_failure{ *pe } };

   return program_result_check{ program_unknown_error{ e, std::nullopt } };
}

check compute_units( uint64_t units )
{
   return compute_units_check{ units };
}

account_check_builder account( const pubkey& key )
{
   return account_check_builder( key );
}

check return_data( const std::vector< uint8_t >& data )
{
   return return_data_check{ data };
}

} // checks

/*
 * Evaluation
 */

namespace {

template< typename T >
std::string mismatch( const std::string& what, const T& expected, const T& actual )
{
   std::stringstream ss;
   ss << what << ": expected " << expected << ", got " << actual;
   return ss.str();
}

void evaluate_account( const instruction_result& result, const account_check& c, std::vector< std::string >& failures )
{
   const auto* acct = result.get_account( c.key );
   const std::string prefix = "account " + c.key.to_string();

   if ( !acct )
   {
      failures.push_back( prefix + ": not found in resulting accounts" );
      return;
   }

   if ( c.lamports && *c.lamports != acct->lamports )
      failures.push_back( mismatch( prefix + " lamports", *c.lamports, acct->lamports ) );

   if ( c.data && *c.data != acct->data )
      failures.push_back( (mismatch)( prefix + " data", util::to_hex( *c.data ), util::to_hex( acct->data ) ) );

   if ( c.owner && *c.owner != acct->owner )
      failures.push_back( (mismatch)( prefix + " owner", c.owner->to_string(), acct->owner.to_string() ) );

   if ( c.executable && *c.executable != acct->executable )
      failures.push_back( mismatch( prefix + " executable", *c.executable, acct->executable ) );

   if ( c.space && *c.space != acct->data.size() )
      failures.push_back( mismatch( prefix + " space", *c.space, acct->data.size() ) );

   if ( c.rent_epoch && *c.rent_epoch != acct->rent_epoch )
      failures.push_back( mismatch( prefix + " rent epoch", *c.rent_epoch, acct->rent_epoch ) );

   for ( const auto& p : c.predicates )
   {
      if ( !p.fn( *acct ) )
         failures.push_back( prefix + ": " + p.description );
   }
}

} // anonymous

std::vector< std::string > evaluate_checks( const instruction_result& result, const std::vector< check >& checks )
{
   std::vector< std::string > failures;

   for ( const auto& c : checks )
   {
      std::visit( overloaded {
         [&]( const program_result_check& prc )
         {
            if ( !( prc.expected == result.program_result ) )
               failures.push_back( (mismatch)( "program result", to_string( prc.expected ), to_string( result.program_result ) ) );
         },
         [&]( const compute_units_check& cuc )
         {
            if ( cuc.units != result.compute_units_consumed )
               failures.push_back( mismatch( "compute units", cuc.units, result.compute_units_consumed ) );
         },
         [&]( const account_check& ac )
         {
            evaluate_account( result, ac, failures );
         },
         [&]( const return_data_check& rdc )
         {
            if ( rdc.data != result.return_data )
               failures.push_back( (mismatch)( "return data", util::to_hex( rdc.data ), util::to_hex( result.return_data ) ) );
         }
      }, c );
   }

   return failures;
}

void run_checks( const instruction_result& result, const std::vector< check >& checks )
{
   auto failures = evaluate_checks( result, checks );
   if ( failures.empty() )
      return;

   std::string joined;
   for ( const auto& f : failures )
   {
      LOG(error) << "Check failed: " << f;

      if ( !joined.empty() )
         joined += "; ";
      joined += f;
   }

   MOLLUSK_THROW( check_failure_exception, "${count} check(s) failed: ${failures}",
      ("count", failures.size())("failures", joined) );
}

} // mollusk

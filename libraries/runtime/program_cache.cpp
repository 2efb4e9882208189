#include <mollusk/runtime/builtins.hpp>
#include <mollusk/runtime/constants.hpp>
#include <mollusk/runtime/exceptions.hpp>
#include <mollusk/runtime/program_cache.hpp>
#include <mollusk/runtime/system_calls.hpp>

#include <mollusk/log.hpp>

#include <chrono>
#include <mutex>

namespace mollusk::runtime {

/*
 * Program cache entry
 */

program_cache_entry::program_cache_entry( const pubkey& loader, program_type program, load_metrics metrics ) :
   _loader( loader ),
   _program( std::move( program ) ),
   _metrics( std::move( metrics ) )
{}

const pubkey& program_cache_entry::loader() const
{
   return _loader;
}

const program_cache_entry::program_type& program_cache_entry::program() const
{
   return _program;
}

bool program_cache_entry::is_builtin() const
{
   return std::holds_alternative< builtin_program >( _program );
}

const load_metrics& program_cache_entry::metrics() const
{
   return _metrics;
}

uint64_t program_cache_entry::invocation_count() const
{
   return _invocation_count.load( std::memory_order_relaxed );
}

void program_cache_entry::record_invocation() const
{
   _invocation_count.fetch_add( 1, std::memory_order_relaxed );
}

/*
 * Program cache
 */

program_cache::program_cache() : program_cache( vm_manager::get_vm_backend() ) {}

program_cache::program_cache( std::shared_ptr< vm_manager::vm_backend > backend ) : _backend( backend )
{
   MOLLUSK_ASSERT( _backend, internal_error_exception, "program cache requires a vm backend" );

   for ( const auto& b : default_builtins() )
      add_builtin( b );
}

void program_cache::add_program(
   const pubkey& program_id,
   const pubkey& loader_id,
   const std::vector< uint8_t >& bytecode,
   const compute_budget& budget,
   const feature_set& features,
   const std::string& name )
{
   std::unique_lock< std::shared_mutex > lock( _mutex );

   auto start = std::chrono::steady_clock::now();
   auto exe = _backend->load( bytecode, make_runtime_environment( budget, features ) );
   auto load_us = std::chrono::duration_cast< std::chrono::microseconds >( std::chrono::steady_clock::now() - start ).count();

   load_metrics metrics;
   metrics.program_name  = name.empty() ? program_id.to_string() : name;
   metrics.bytecode_size = bytecode.size();
   metrics.load_us       = uint64_t( load_us );

   LOG(debug) << "Loaded program " << metrics.program_name << " (" << metrics.bytecode_size << " bytes) in " << metrics.load_us << "us";

   _entries[ program_id ] = std::make_shared< const program_cache_entry >(
      loader_id,
      bytecode_program{ _backend, exe },
      std::move( metrics ) );
}

void program_cache::add_builtin( const builtin& b )
{
   MOLLUSK_ASSERT( b.entrypoint, internal_error_exception, "builtin ${n} has no entrypoint", ("n", b.name) );

   load_metrics metrics;
   metrics.program_name  = b.name;
   metrics.bytecode_size = b.name.size();

   std::unique_lock< std::shared_mutex > lock( _mutex );
   _entries[ b.program_id ] = std::make_shared< const program_cache_entry >(
      program_id::native_loader(),
      builtin_program{ b.entrypoint },
      std::move( metrics ) );
}

program_cache_entry_ptr program_cache::find( const pubkey& program_id ) const
{
   std::shared_lock< std::shared_mutex > lock( _mutex );

   auto it = _entries.find( program_id );
   if ( it == _entries.end() )
      return program_cache_entry_ptr();

   return it->second;
}

std::size_t program_cache::size() const
{
   std::shared_lock< std::shared_mutex > lock( _mutex );
   return _entries.size();
}

std::vector< pubkey > program_cache::program_ids() const
{
   std::shared_lock< std::shared_mutex > lock( _mutex );

   std::vector< pubkey > ids;
   ids.reserve( _entries.size() );
   for ( const auto& [ id, entry ] : _entries )
      ids.push_back( id );

   return ids;
}

std::shared_ptr< vm_manager::vm_backend > program_cache::backend() const
{
   return _backend;
}

} // mollusk::runtime

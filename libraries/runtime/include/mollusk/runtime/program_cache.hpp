#pragma once

#include <mollusk/runtime/compute_budget.hpp>
#include <mollusk/runtime/feature_set.hpp>
#include <mollusk/runtime/types.hpp>

#include <mollusk/vm_manager/vm_backend.hpp>

#include <boost/container/flat_map.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

namespace mollusk::runtime {

class invoke_context;

using builtin_entrypoint = std::function< void( invoke_context& ) >;

struct builtin_program
{
   builtin_entrypoint entrypoint;
};

struct bytecode_program
{
   std::shared_ptr< vm_manager::vm_backend > backend;
   vm_manager::executable_ptr                executable;
};

struct load_metrics
{
   std::string program_name;
   std::size_t bytecode_size = 0;
   uint64_t    load_us       = 0;
};

/**
 * A loaded program. Immutable apart from its invocation counter.
 */
class program_cache_entry
{
   public:
      using program_type = std::variant< builtin_program, bytecode_program >;

      program_cache_entry( const pubkey& loader, program_type program, load_metrics metrics );

      const pubkey& loader() const;
      const program_type& program() const;
      bool is_builtin() const;
      const load_metrics& metrics() const;

      uint64_t invocation_count() const;
      void record_invocation() const;

   private:
      pubkey                          _loader;
      program_type                    _program;
      load_metrics                    _metrics;
      mutable std::atomic< uint64_t > _invocation_count{ 0 };
};

using program_cache_entry_ptr = std::shared_ptr< const program_cache_entry >;

struct builtin
{
   pubkey             program_id;
   std::string        name;
   builtin_entrypoint entrypoint;
};

/**
 * Loaded programs keyed by program id.
 *
 * Adding a program replaces any existing entry for the id. Lookups return a
 * shared pointer to the immutable entry, so callers keep using an entry that
 * was replaced after they found it.
 */
class program_cache
{
   public:
      program_cache();
      explicit program_cache( std::shared_ptr< vm_manager::vm_backend > backend );

      program_cache( const program_cache& ) = delete;
      program_cache& operator=( const program_cache& ) = delete;

      /**
       * Verify bytecode and insert it under program_id. Throws a
       * vm_manager::load_exception if the bytecode is rejected, in which case
       * the cache is left unchanged.
       */
      void add_program(
         const pubkey& program_id,
         const pubkey& loader_id,
         const std::vector< uint8_t >& bytecode,
         const compute_budget& budget,
         const feature_set& features,
         const std::string& name = std::string() );

      void add_builtin( const builtin& b );

      program_cache_entry_ptr find( const pubkey& program_id ) const;

      std::size_t size() const;
      std::vector< pubkey > program_ids() const;

      std::shared_ptr< vm_manager::vm_backend > backend() const;

   private:
      mutable std::shared_mutex                                         _mutex;
      boost::container::flat_map< pubkey, program_cache_entry_ptr >     _entries;
      std::shared_ptr< vm_manager::vm_backend >                         _backend;
};

} // mollusk::runtime

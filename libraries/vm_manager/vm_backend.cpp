#include <mollusk/vm_manager/exceptions.hpp>
#include <mollusk/vm_manager/vm_backend.hpp>

#include <mollusk/vm_manager/fizzy/fizzy_vm_backend.hpp>

namespace mollusk::vm_manager {

abstract_host_api::abstract_host_api() {}
abstract_host_api::~abstract_host_api() {}

executable::executable() {}
executable::~executable() {}

vm_backend::vm_backend() {}
vm_backend::~vm_backend() {}

std::vector< std::shared_ptr< vm_backend > > get_vm_backends()
{
   std::vector< std::shared_ptr< vm_backend > > result;

   result.push_back( std::make_shared< vm_manager::fizzy::fizzy_vm_backend >() );

   return result;
}

std::string get_default_vm_backend_name()
{
   const std::string default_vm_backend = "fizzy";
   return default_vm_backend;
}

std::shared_ptr< vm_backend > get_vm_backend( const std::string& name )
{
   for( const auto& b : get_vm_backends() )
   {
      if( b->backend_name() == name )
      {
         b->initialize();
         return b;
      }
   }

   MOLLUSK_THROW( unknown_backend_exception, "unknown vm backend '${name}'", ("name", name) );
}

} // mollusk::vm_manager

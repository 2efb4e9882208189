#include <mollusk/harness/exceptions.hpp>
#include <mollusk/harness/file.hpp>

#include <mollusk/log.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace mollusk::file {

std::vector< std::filesystem::path > default_search_paths()
{
   std::vector< std::filesystem::path > paths;

   if ( const char* env = std::getenv( program_path_env ) )
   {
      std::string value( env );
      std::size_t start = 0;

      while ( start <= value.size() )
      {
         auto end = value.find( ':', start );
         if ( end == std::string::npos )
            end = value.size();

         if ( end > start )
            paths.emplace_back( value.substr( start, end - start ) );

         start = end + 1;
      }
   }

   paths.emplace_back( "tests/fixtures" );
   paths.emplace_back( "target/deploy" );
   paths.emplace_back( std::filesystem::current_path() );

   return paths;
}

std::vector< uint8_t > read_file( const std::filesystem::path& path )
{
   std::ifstream ifs( path, std::ios::binary );
   MOLLUSK_ASSERT( ifs.is_open(), program_file_not_found_exception, "unable to open ${p}", ("p", path.string()) );

   return std::vector< uint8_t >( std::istreambuf_iterator< char >( ifs ), std::istreambuf_iterator< char >() );
}

std::vector< uint8_t > load_program_bytecode( const std::string& name )
{
   return load_program_bytecode( name, default_search_paths() );
}

std::vector< uint8_t > load_program_bytecode( const std::string& name, const std::vector< std::filesystem::path >& search_paths )
{
   const std::string file_name = name + bytecode_extension;

   for ( const auto& dir : search_paths )
   {
      auto candidate = dir / file_name;

      std::error_code ec;
      if ( std::filesystem::is_regular_file( candidate, ec ) )
      {
         LOG(debug) << "Loading program " << name << " from " << candidate.string();
         return read_file( candidate );
      }
   }

   MOLLUSK_THROW( program_file_not_found_exception, "program file ${f} not found in search paths", ("f", file_name) );
}

} // mollusk::file

#include <mollusk/exception.hpp>

namespace mollusk { namespace detail {

namespace {

// Replace each ${key} found in j with its value. Strings are inserted without
// their JSON quotes; unknown keys are left as written.
std::string json_strpolate( const std::string& format_str, const nlohmann::json& j )
{
   std::string result;
   result.reserve( format_str.size() );

   std::size_t pos = 0;
   while ( pos < format_str.size() )
   {
      auto open = format_str.find( "${", pos );
      if ( open == std::string::npos )
         break;

      auto close = format_str.find( '}', open + 2 );
      if ( close == std::string::npos )
         break;

      result.append( format_str, pos, open - pos );

      auto it = j.find( format_str.substr( open + 2, close - open - 2 ) );
      if ( it == j.end() )
         result.append( format_str, open, close - open + 1 );
      else if ( it->is_string() )
         result += it->get_ref< const std::string& >();
      else
         result += it->dump();

      pos = close + 1;
   }

   result.append( format_str, pos, std::string::npos );
   return result;
}

} // anonymous

json_initializer::json_initializer( exception& e ) :
   _e( e ),
   _j( *boost::get_error_info< json_info >( e ) )
{}

json_initializer& json_initializer::operator()( const std::string& key, const char* c )
{
   _j[key] = c;
   _e.do_message_substitution();
   return *this;
}

} // detail

exception::exception() { *this << detail::json_info( nlohmann::json::object() ); }

exception::exception( const std::string& m ) : exception() { msg = m; }

exception::exception( std::string&& m ) : exception() { msg = std::move( m ); }

exception::exception( const std::string& m, int64_t c ) : exception() { msg = m; code = c; }

exception::~exception() {}

const char* exception::what() const noexcept
{
   return msg.c_str();
}

const nlohmann::json& exception::get_json() const
{
   return *boost::get_error_info< detail::json_info >( *this );
}

const std::string& exception::get_message() const
{
   return msg;
}

int64_t exception::get_code() const
{
   return code;
}

void exception::do_message_substitution()
{
   msg = detail::json_strpolate( msg, get_json() );
}

} // mollusk

#include <mollusk/log.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup.hpp>
#include <boost/make_shared.hpp>

#include <iostream>
#include <mutex>

namespace mollusk {

namespace {

using severity_level = boost::log::trivial::severity_level;

const char* severity_color( severity_level level )
{
   switch ( level )
   {
      case boost::log::trivial::warning:
         return "\033[33m";
      case boost::log::trivial::error:
      case boost::log::trivial::fatal:
         return "\033[31m";
      default:
         return "\033[32m";
   }
}

template< bool Color >
class console_sink_backend : public boost::log::sinks::basic_formatted_sink_backend< char, boost::log::sinks::synchronized_feeding >
{
public:
   static void consume( const boost::log::record_view& rec, const string_type& message )
   {
      auto level = rec[ boost::log::trivial::severity ];
      auto line  = rec.attribute_values()[ "Line" ].extract< int >();
      auto file  = rec.attribute_values()[ "File" ].extract< std::string >();
      auto ptime = rec.attribute_values()[ "TimeStamp" ].extract< boost::posix_time::ptime >();

      severity_level sev = level ? level.get() : boost::log::trivial::info;
      const char* name = boost::log::trivial::to_string( sev );

      auto& s = std::clog;

      if ( ptime )
         s << boost::posix_time::to_iso_extended_string( ptime.get() );

      if ( file && line )
         s << " [" << file.get() << ":" << line.get() << "] ";
      else
         s << " ";

      s << "<";
      if constexpr ( Color )
         s << severity_color( sev ) << ( name ? name : "unknown" ) << "\033[0m";
      else
         s << ( name ? name : "unknown" );
      s << ">: " << message << std::endl;
   }
};

severity_level severity_from_string( const std::string& level )
{
   severity_level sev = boost::log::trivial::info;

   if ( !boost::log::trivial::from_string( level.c_str(), level.size(), sev ) )
      return boost::log::trivial::info;

   return sev;
}

} // anonymous

void initialize_logging( const std::string& level, const std::optional< std::filesystem::path >& log_dir, bool color )
{
   static std::once_flag initialized;

   std::call_once( initialized, [&]()
   {
      if ( color )
         boost::log::core::get()->add_sink( boost::make_shared< boost::log::sinks::synchronous_sink< console_sink_backend< true > > >() );
      else
         boost::log::core::get()->add_sink( boost::make_shared< boost::log::sinks::synchronous_sink< console_sink_backend< false > > >() );

      if ( log_dir )
      {
         boost::log::register_simple_formatter_factory< severity_level, char >( "Severity" );

         // Rotate at 1MiB or midnight, keep 20MiB in total
         boost::log::add_file_log(
            boost::log::keywords::file_name = ( *log_dir / "mollusk_%3N.log" ).string(),
            boost::log::keywords::rotation_size = 1 * 1024 * 1024,
            boost::log::keywords::max_size = 20 * 1024 * 1024,
            boost::log::keywords::time_based_rotation = boost::log::sinks::file::rotation_at_time_point( 0, 0, 0 ),
            boost::log::keywords::format = "%TimeStamp% [%File%:%Line%] <%Severity%>: %Message%",
            boost::log::keywords::auto_flush = true );
      }

      boost::log::add_common_attributes();
      boost::log::core::get()->set_filter( boost::log::trivial::severity >= severity_from_string( level ) );
   } );
}

} // mollusk

#pragma once

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

#include <nlohmann/json.hpp>

#include <mollusk/log.hpp>

#include <cstdint>
#include <string>

#define _DETAIL_MOLLUSK_INIT_VA_ARGS( ... ) init __VA_ARGS__

#define MOLLUSK_THROW( exception, msg, ... ) \
do {  \
   exception e(msg);                         \
   mollusk::detail::json_initializer init(e);\
   _DETAIL_MOLLUSK_INIT_VA_ARGS( __VA_ARGS__ ); \
   BOOST_THROW_EXCEPTION( \
      e \
      << mollusk::detail::exception_stacktrace( boost::stacktrace::stacktrace() ) \
   ); \
} while(0)

#define MOLLUSK_ASSERT( cond, exc_name, msg, ... )    \
   do {                                               \
      if( !(cond) )                                   \
      {                                               \
         MOLLUSK_THROW( exc_name, msg, __VA_ARGS__ ); \
      }                                               \
   } while (0)

#define MOLLUSK_CATCH_LOG_AND_RETHROW( log_level )          \
catch( mollusk::exception& e )                              \
{                                                           \
   LOG( log_level ) << boost::diagnostic_information( e );  \
   throw;                                                   \
}

#define MOLLUSK_DECLARE_EXCEPTION( exc_name )                         \
   struct exc_name : public mollusk::exception                        \
   {                                                                  \
      exc_name() {}                                                   \
      exc_name( const std::string& m ) : mollusk::exception( m ) {}   \
      exc_name( std::string&& m ) : mollusk::exception( m ) {}        \
                                                                      \
      virtual ~exc_name() {};                                         \
   };

#define MOLLUSK_DECLARE_DERIVED_EXCEPTION( exc_name, base ) \
   struct exc_name : public base                            \
   {                                                        \
      exc_name() {}                                         \
      exc_name( const std::string& m ) : base( m ) {}       \
      exc_name( std::string&& m ) : base( m ) {}            \
                                                            \
      virtual ~exc_name() {};                               \
   };

#define MOLLUSK_DECLARE_EXCEPTION_WITH_CODE( exc_name, code )                         \
   struct exc_name : public mollusk::exception                                        \
   {                                                                                  \
      exc_name() : mollusk::exception( std::string(), int64_t( code ) ) {}            \
      exc_name( const std::string& m ) : mollusk::exception( m, int64_t( code ) ) {}  \
      exc_name( std::string&& m ) : mollusk::exception( m, int64_t( code ) ) {}       \
      exc_name( const std::string& m, int64_t c ) : mollusk::exception( m, c ) {}     \
                                                                                      \
      virtual ~exc_name() {};                                                         \
   };

#define MOLLUSK_DECLARE_DERIVED_EXCEPTION_WITH_CODE( exc_name, base, code ) \
   struct exc_name : public base                                            \
   {                                                                        \
      exc_name() : base( std::string(), int64_t( code ) ) {}                \
      exc_name( const std::string& m ) : base( m, int64_t( code ) ) {}      \
      exc_name( std::string&& m ) : base( m, int64_t( code ) ) {}           \
      exc_name( const std::string& m, int64_t c ) : base( m, c ) {}         \
                                                                            \
      virtual ~exc_name() {};                                               \
   };

namespace mollusk {

// Forward declaration
namespace detail { struct json_initializer; }

constexpr int64_t unknown_error_code = -1;

struct exception : virtual boost::exception, virtual std::exception
{
   private:
      std::string msg;
      int64_t     code = unknown_error_code;

   public:
      exception();
      exception( const std::string& m );
      exception( std::string&& m );
      exception( const std::string& m, int64_t c );

      virtual ~exception();

      virtual const char* what() const noexcept override;

      const nlohmann::json& get_json() const;
      const std::string& get_message() const;
      int64_t get_code() const;

   private:
      friend struct detail::json_initializer;

      void do_message_substitution();
};


namespace detail {

using json_info = boost::error_info< struct json_tag, nlohmann::json >;
using exception_stacktrace = boost::error_info< struct stacktrace_tag, boost::stacktrace::stacktrace >;

/**
 * Initializes a json object using a bubble list of key value pairs.
 */
struct json_initializer
{
   exception& _e;
   nlohmann::json& _j;

   json_initializer() = delete;
   json_initializer( exception& e );

   json_initializer& operator()( const std::string& key, const char* c );

   template< typename T >
   json_initializer& operator()( const std::string& key, const T& t )
   {
      _j[key] = t;
      _e.do_message_substitution();
      return *this;
   }
};

} } // mollusk::detail

#pragma once

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

#include <nlohmann/json.hpp>

#include <keystone/log.hpp>

#include <cstdint>
#include <string>

#define _DETAIL_KEYSTONE_INIT_VA_ARGS( ... ) init __VA_ARGS__

#define KEYSTONE_THROW( exception, msg, ... )                                  \
do {                                                                           \
   exception e(msg);                                                           \
   keystone::detail::json_initializer init(e);                                 \
   _DETAIL_KEYSTONE_INIT_VA_ARGS( __VA_ARGS__ );                               \
   BOOST_THROW_EXCEPTION(                                                      \
      e                                                                        \
      << keystone::detail::exception_stacktrace( boost::stacktrace::stacktrace() ) \
   );                                                                          \
} while(0)

#define KEYSTONE_ASSERT( cond, exc_name, msg, ... )    \
   do {                                                \
      if( !(cond) )                                    \
      {                                                \
         KEYSTONE_THROW( exc_name, msg, __VA_ARGS__ ); \
      }                                                \
   } while (0)

#define KEYSTONE_CAPTURE_CATCH_AND_RETHROW( ... ) \
catch( keystone::exception& e )                   \
{                                                 \
   keystone::detail::json_initializer init(e);    \
   _DETAIL_KEYSTONE_INIT_VA_ARGS( __VA_ARGS__ );  \
   throw;                                         \
}

#define KEYSTONE_CATCH_LOG_AND_RETHROW( log_level )         \
catch( keystone::exception& e )                             \
{                                                           \
   LOG( log_level ) << boost::diagnostic_information( e );  \
   throw;                                                   \
}

#define KEYSTONE_CATCH_AND_LOG( log_level )                 \
catch( keystone::exception& e )                             \
{                                                           \
   LOG( log_level ) << boost::diagnostic_information( e );  \
}

#define KEYSTONE_CATCH_AND_GET_JSON( j ) \
catch( keystone::exception& e )          \
{                                        \
   j = e.get_json();                     \
}

#define KEYSTONE_DECLARE_EXCEPTION( exc_name )                          \
   struct exc_name : public keystone::exception                         \
   {                                                                    \
      exc_name() {}                                                     \
      exc_name( const std::string& m ) : keystone::exception( m ) {}    \
      exc_name( std::string&& m ) : keystone::exception( m ) {}         \
                                                                        \
      virtual ~exc_name() {};                                           \
   };

#define KEYSTONE_DECLARE_DERIVED_EXCEPTION( exc_name, base )  \
   struct exc_name : public base                              \
   {                                                          \
      exc_name() {}                                           \
      exc_name( const std::string& m ) : base( m ) {}         \
      exc_name( std::string&& m ) : base( m ) {}              \
                                                              \
      virtual ~exc_name() {};                                 \
   };

#define KEYSTONE_DECLARE_EXCEPTION_WITH_CODE( exc_name, code )                  \
   struct exc_name : public keystone::exception                                 \
   {                                                                            \
      exc_name() {}                                                             \
      exc_name( const std::string& m ) : keystone::exception( m ) {}            \
      exc_name( std::string&& m ) : keystone::exception( m ) {}                 \
                                                                                \
      virtual ~exc_name() {};                                                   \
                                                                                \
      virtual int32_t get_code() const override { return int32_t( code ); }     \
   };

#define KEYSTONE_DECLARE_DERIVED_EXCEPTION_WITH_CODE( exc_name, base, code )    \
   struct exc_name : public base                                                \
   {                                                                            \
      exc_name() {}                                                             \
      exc_name( const std::string& m ) : base( m ) {}                           \
      exc_name( std::string&& m ) : base( m ) {}                                \
                                                                                \
      virtual ~exc_name() {};                                                   \
                                                                                \
      virtual int32_t get_code() const override { return int32_t( code ); }     \
   };

namespace keystone {

// Forward declaration
namespace detail { struct json_initializer; }

/**
 * Exceptions with no code report this value from get_code().
 */
constexpr int32_t unknown_error_code = -1;

struct exception : virtual boost::exception, virtual std::exception
{
   private:
      std::string msg;

   public:
      exception();
      exception( const std::string& m );
      exception( std::string&& m );

      virtual ~exception();

      virtual const char* what() const noexcept override;
      virtual int32_t get_code() const;

      std::string get_stacktrace() const;
      const nlohmann::json& get_json() const;
      const std::string& get_message() const;

   private:
      friend struct detail::json_initializer;

      void do_message_substitution();
};


namespace detail {

using json_info = boost::error_info< struct json_tag, nlohmann::json >;
using exception_stacktrace = boost::error_info< struct stacktrace_tag, boost::stacktrace::stacktrace >;

std::string format_message( const std::string& format, const nlohmann::json& values );

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
   json_initializer& operator()();

   template< typename T >
   json_initializer& operator()( const std::string& key, const T& t )
   {
      _j[key] = t;
      _e.do_message_substitution();
      return *this;
   }
};

} } // keystone::detail

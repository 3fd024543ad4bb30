#include <keystone/exception.hpp>

#include <sstream>

namespace keystone { namespace detail {

namespace {

std::string unquote( std::string s )
{
   if ( s.size() >= 2 && s.front() == '"' && s.back() == '"' )
      return s.substr( 1, s.size() - 2 );

   return s;
}

} // anonymous

std::string format_message( const std::string& format, const nlohmann::json& values )
{
   std::string result;
   result.reserve( format.size() );

   std::size_t pos = 0;
   while ( pos < format.size() )
   {
      auto open = format.find( "${", pos );
      if ( open == std::string::npos )
         break;

      result.append( format, pos, open - pos );

      // ${$ is a literal ${
      if ( open + 2 < format.size() && format[ open + 2 ] == '$' )
      {
         result.append( "${$" );
         pos = open + 3;
         continue;
      }

      auto close = format.find( '}', open + 2 );
      if ( close == std::string::npos )
      {
         pos = open;
         break;
      }

      auto itr = values.find( format.substr( open + 2, close - open - 2 ) );
      if ( itr != values.end() )
         result += unquote( itr->dump() );
      else
         result.append( format, open, close - open + 1 );

      pos = close + 1;
   }

   result.append( format, pos, std::string::npos );
   return result;
}

json_initializer::json_initializer( exception& e ) :
   _e(e),
   _j(*boost::get_error_info< keystone::detail::json_info >(e))
{}

json_initializer& json_initializer::operator()( const std::string& key, const char* c )
{
   _j[key] = c;
   _e.do_message_substitution();
   return *this;
}

json_initializer& json_initializer::operator()()
{
   return *this;
}

} // detail

exception::exception() { *this << keystone::detail::json_info( nlohmann::json::object() ); }

exception::exception( const std::string& m ) : exception() { msg = m; }

exception::exception( std::string&& m ) : exception() { msg = std::move( m ); }

exception::~exception() {}

const char* exception::what() const noexcept
{
   return msg.c_str();
}

int32_t exception::get_code() const
{
   return unknown_error_code;
}

std::string exception::get_stacktrace() const
{
   std::stringstream ss;
   if ( auto st = boost::get_error_info< keystone::detail::exception_stacktrace >( *this ); st )
      ss << *st;
   return ss.str();
}

const nlohmann::json& exception::get_json() const
{
   return *boost::get_error_info< keystone::detail::json_info >( *this );
}

const std::string& exception::get_message() const
{
   return msg;
}

void exception::do_message_substitution()
{
   msg = detail::format_message( msg, *boost::get_error_info< keystone::detail::json_info >( *this ) );
}

} // keystone

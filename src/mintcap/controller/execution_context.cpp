#include <algorithm>
#include <stdexcept>
#include <string>

#include <mintcap/controller/execution_context.hpp>
#include <mintcap/memory.hpp>

namespace mintcap::controller {

constexpr std::size_t event_name_limit = 128;

execution_context::execution_context( const std::shared_ptr< program::program >& program, intent i ):
    _program( program ),
    _intent( i )
{}

void execution_context::set_state_node( const state_db::state_node_ptr& node )
{
  _state_node = node;
}

void execution_context::clear_state_node()
{
  _state_node.reset();
}

protocol::program_output execution_context::run( const protocol::call& call )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( !_program )
    throw std::runtime_error( "program does not exist" );

  _call         = &call;
  _input_offset = 0;
  _stdout.clear();
  _events.clear();

  protocol::program_output output;
  output.code   = _program->run( this );
  output.stdout = std::move( _stdout );

  _stdout.clear();
  _call = nullptr;

  return output;
}

const std::vector< protocol::event >& execution_context::events() const noexcept
{
  return _events;
}

std::error_code execution_context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return reversion_errc::bad_file_descriptor;

  if( !_call )
    throw std::runtime_error( "no call is running" );

  if( _call->stdin.size() - _input_offset < buffer.size() )
    return reversion_errc::insufficient_input;

  std::ranges::copy( std::span( _call->stdin ).subspan( _input_offset, buffer.size() ), buffer.begin() );
  _input_offset += buffer.size();
  return reversion_errc::ok;
}

std::error_code execution_context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  if( fd != program::file_descriptor::stdout )
    return reversion_errc::bad_file_descriptor;

  _stdout.insert( _stdout.end(), buffer.begin(), buffer.end() );
  return reversion_errc::ok;
}

state_db::object_space execution_context::create_object_space( std::uint32_t id ) const
{
  state_db::object_space space{ .id = id };
  std::ranges::copy( state::token_program(), space.program.begin() );

  return space;
}

std::span< const std::byte > execution_context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( auto result = _state_node->get( create_object_space( id ), key ); result )
    return *result;

  return std::span< const std::byte >{};
}

std::error_code
execution_context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->put( create_object_space( id ), key, value );
  return reversion_errc::ok;
}

std::error_code execution_context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  if( !_state_node )
    throw std::runtime_error( "state node does not exist" );

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  _state_node->remove( create_object_space( id ), key );
  return reversion_errc::ok;
}

const protocol::account& execution_context::get_caller()
{
  if( !_call )
    throw std::runtime_error( "no call is running" );

  return _call->caller;
}

std::error_code execution_context::event( std::string_view name,
                                          std::span< const std::byte > data,
                                          const std::vector< protocol::account >& impacted )
{
  if( name.empty() || name.size() > event_name_limit )
    return reversion_errc::invalid_event_name;

  if( _intent == intent::read_only )
    return reversion_errc::read_only_context;

  protocol::event ev;
  ev.sequence = static_cast< std::uint32_t >( _events.size() );
  ev.source   = state::token_program();
  ev.name     = std::string( name );
  ev.data     = std::vector( data.begin(), data.end() );
  ev.impacted = impacted;

  _events.emplace_back( std::move( ev ) );
  return reversion_errc::ok;
}

} // namespace mintcap::controller

#include <mintcap/controller/state.hpp>

namespace mintcap::controller::state {

const protocol::account& token_program()
{
  static const auto account = protocol::system_program( "capped_token" );
  return account;
}

} // namespace mintcap::controller::state

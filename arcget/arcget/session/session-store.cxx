#include <arcget/session/session-store.hxx>

#include <arcget/session/session-record-odb.hxx>

namespace arcget
{
  // Explicit template instantiation.
  //
  template class basic_session_store<session_store_traits<>>;
}

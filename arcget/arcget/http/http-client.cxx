#include <arcget/http/http-client.hxx>

namespace arcget
{
  // Explicit template instantiation.
  //
  template class basic_http_session<http_client_traits<>>;
  template class basic_http_client<http_client_traits<>>;
}

#include "corvid/client-response.hpp"

#include <string_view>

namespace corvid {

std::string_view ClientErrorToStr(ClientError error) {
  switch (error) {
    case ClientError::None:
      return "none";
    case ClientError::ResolveOrConnect:
      return "connect failure";
    case ClientError::ConnectionReset:
      return "connection reset";
    case ClientError::Protocol:
      return "protocol error";
    case ClientError::Timeout:
      return "timeout";
    case ClientError::Cancelled:
      return "cancelled";
    default:
      return "unknown";
  }
}

}  // namespace corvid

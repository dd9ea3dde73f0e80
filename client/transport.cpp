#include "transport.hpp"

const char* to_string(TransportFailure failure)
{
    switch (failure) {
    case TransportFailure::None:             return "none";
    case TransportFailure::ConnectionFailed: return "connection failed";
    case TransportFailure::Timeout:          return "timeout";
    case TransportFailure::ResolveFailed:    return "name resolution failed";
    case TransportFailure::ProtocolError:    return "protocol error";
    case TransportFailure::Other:            return "other";
    }
    return "unknown";
}

#include "bridge/Result.hpp"

namespace wb
{

char const *to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::InvalidArgument:
        return "invalid argument";
    case ErrorKind::HostError:
        return "host error";
    case ErrorKind::CreationError:
        return "creation error";
    case ErrorKind::HandlerError:
        return "handler error";
    case ErrorKind::ProtocolError:
        return "protocol error";
    }
    return "unknown error";
}

} // namespace wb

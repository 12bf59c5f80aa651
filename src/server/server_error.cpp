#include "server/server_error.hpp"

#include <string>

namespace {
class ServerErrorCategory : public boost::system::error_category {
public:
    const char *name() const noexcept override
    {
        return "davhost.server";
    }

    std::string message(int value) const override
    {
        switch (static_cast<davhost::server::ServerError>(value)) {
        case davhost::server::ServerError::SERVER_CLOSED:
            return "http: Server closed";
        case davhost::server::ServerError::SERVE_ABORTED:
            return "http: serve loop aborted";
        default:
            return "unknown server error";
        }
    }
};
} // namespace

namespace davhost::server {
const boost::system::error_category &serverErrorCategory()
{
    static const ServerErrorCategory category;
    return category;
}

boost::system::error_code make_error_code(ServerError error)
{
    return boost::system::error_code(static_cast<int>(error), serverErrorCategory());
}
} // namespace davhost::server

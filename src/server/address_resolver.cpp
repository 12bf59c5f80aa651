#include "server/address_resolver.hpp"

#include <system_error>

#include "utils/file_utils.hpp"
#include "utils/logger.hpp"

namespace {
// Разделение "хост:порт" по последнему двоеточию, квадратные скобки IPv6 отбрасываются
std::pair<std::string, std::string> splitHostPort(const std::string &address)
{
    const auto pos = address.rfind(':');
    if (pos == std::string::npos) {
        return { address, "" };
    }

    auto host = address.substr(0, pos);
    auto port = address.substr(pos + 1);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return { host, port };
}
} // namespace

namespace davhost::server {
ListenAddress resolveListenAddress(const std::string &address, const std::string &port)
{
    const std::string prefix(LOCAL_SOCKET_PREFIX);
    if (address.compare(0, prefix.size(), prefix) == 0) {
        return { TransportKind::LOCAL, address.substr(prefix.size()) };
    }
    return { TransportKind::TCP, address + ":" + port };
}

Listener::Listener(TransportKind kind)
    : kind_(kind)
    , port_(0)
    , closed_(false)
{
}

Listener::~Listener()
{
    boost::system::error_code ec;
    close(ec);
}

std::unique_ptr<Listener> Listener::bind(boost::asio::io_context &ioCtx,
                                         const ListenAddress &address,
                                         boost::system::error_code &ec)
{
    namespace asio = boost::asio;
    ec.clear();

    std::unique_ptr<Listener> listener(new Listener(address.kind));

    if (address.kind == TransportKind::LOCAL) {
        LOG_DEBUG << "Связывание Unix Domain Socket: " << address.address;

        asio::local::stream_protocol::endpoint endpoint;
        try {
            endpoint = asio::local::stream_protocol::endpoint(address.address);
        }
        catch (const boost::system::system_error &e) {
            // Слишком длинный путь
            ec = e.code();
            return nullptr;
        }

        auto acceptor = std::make_unique<LocalAcceptor>(ioCtx);
        acceptor->open(endpoint.protocol(), ec);
        if (ec) {
            return nullptr;
        }
        acceptor->bind(endpoint, ec);
        if (ec) {
            return nullptr;
        }
        // С этого момента файл сокета принадлежит слушателю
        listener->socketPath_ = address.address;
        listener->localAcceptor_ = std::move(acceptor);
        listener->localAcceptor_->listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            return nullptr;
        }
        return listener;
    }

    const auto [host, service] = splitHostPort(address.address);
    LOG_DEBUG << "Связывание TCP: хост '" << host << "', порт '" << service << "'";

    asio::ip::tcp::resolver resolver(ioCtx);
    // Пустой хост - все интерфейсы IPv4, пустой порт - любой свободный
    const auto results = resolver.resolve(host.empty() ? std::string("0.0.0.0") : host,
                                          service.empty() ? std::string("0") : service,
                                          asio::ip::tcp::resolver::passive, ec);
    if (ec) {
        return nullptr;
    }
    if (results.empty()) {
        ec = asio::error::host_not_found;
        return nullptr;
    }

    const asio::ip::tcp::endpoint endpoint = results.begin()->endpoint();
    auto acceptor = std::make_unique<TcpAcceptor>(ioCtx);
    acceptor->open(endpoint.protocol(), ec);
    if (ec) {
        return nullptr;
    }
    acceptor->set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        return nullptr;
    }
    acceptor->bind(endpoint, ec);
    if (ec) {
        return nullptr;
    }
    acceptor->listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return nullptr;
    }

    const auto local = acceptor->local_endpoint(ec);
    if (ec) {
        return nullptr;
    }
    listener->port_ = local.port();
    listener->tcpAcceptor_ = std::move(acceptor);

    LOG_DEBUG << "TCP слушатель связан с " << local.address().to_string() << ":"
              << listener->port_;
    return listener;
}

TransportKind Listener::kind() const
{
    return kind_;
}

uint16_t Listener::port() const
{
    return port_;
}

std::string Listener::boundAddress() const
{
    if (kind_ == TransportKind::TCP) {
        return std::to_string(port_);
    }
    return socketPath_.string();
}

bool Listener::isOpen() const
{
    if (tcpAcceptor_ != nullptr) {
        return tcpAcceptor_->is_open();
    }
    if (localAcceptor_ != nullptr) {
        return localAcceptor_->is_open();
    }
    return false;
}

int Listener::nativeHandle()
{
    if (tcpAcceptor_ != nullptr) {
        return tcpAcceptor_->native_handle();
    }
    if (localAcceptor_ != nullptr) {
        return localAcceptor_->native_handle();
    }
    return -1;
}

void Listener::close(boost::system::error_code &ec)
{
    ec.clear();
    if (closed_) {
        return;
    }
    closed_ = true;

    if (tcpAcceptor_ != nullptr) {
        tcpAcceptor_->close(ec);
        return;
    }

    if (localAcceptor_ != nullptr) {
        localAcceptor_->close(ec);

        // Ошибка удаления файла сокета не считается ошибкой закрытия
        std::error_code removeEc;
        utils::removeFileIfExists(socketPath_, removeEc);
    }
}

Listener::TcpAcceptor *Listener::tcpAcceptor()
{
    return tcpAcceptor_.get();
}

Listener::LocalAcceptor *Listener::localAcceptor()
{
    return localAcceptor_.get();
}
} // namespace davhost::server

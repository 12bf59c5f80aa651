#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

namespace davhost::server {
/**
 * @enum TransportKind
 * @brief Вид транспорта, на котором принимаются соединения
 */
enum class TransportKind {
    TCP, // TCP, адрес вида "хост:порт"
    LOCAL, // Unix Domain Socket, адрес - путь в файловой системе
};

/**
 * @struct ListenAddress
 * @brief Разобранный адрес прослушивания
 */
struct ListenAddress {
    TransportKind kind;
    std::string address; // "хост:порт" для TCP или путь к сокету для LOCAL
};

/**
 * @brief Префикс адреса, обозначающий Unix Domain Socket
 */
inline constexpr char LOCAL_SOCKET_PREFIX[] = "unix:";

/**
 * @brief Разбор адреса прослушивания
 *
 * Адрес, начинающийся с "unix:", задает путь к Unix Domain Socket (префикс отбрасывается).
 * Иначе адрес TCP формируется как "<address>:<port>", порт "0" означает выбор свободного
 * порта операционной системой.
 *
 * @param address Адрес из конфигурации
 * @param port Порт из конфигурации
 * @return Разобранный адрес
 */
ListenAddress resolveListenAddress(const std::string &address, const std::string &port);

/**
 * @class Listener
 * @brief Связанный и прослушивающий сокет
 *
 * Владеет аксептором TCP либо Unix Domain Socket. Для Unix Domain Socket при закрытии
 * удаляет созданный файл сокета. Все операции, кроме bind(), выполняются в потоке,
 * обслуживающем io_context.
 */
class Listener {
public:
    using TcpAcceptor = boost::asio::ip::tcp::acceptor;
    using LocalAcceptor = boost::asio::local::stream_protocol::acceptor;

    /**
     * @brief Связывание сокета с адресом и перевод в режим прослушивания
     * @param ioCtx ASIO контекст, в котором будут приниматься соединения
     * @param address Адрес прослушивания
     * @param[out] ec Код ошибки
     * @return Слушатель или nullptr при ошибке
     */
    static std::unique_ptr<Listener> bind(boost::asio::io_context &ioCtx,
                                          const ListenAddress &address,
                                          boost::system::error_code &ec);

    ~Listener();

    Listener(const Listener &) = delete;
    Listener &operator=(const Listener &) = delete;
    Listener(Listener &&) = delete;
    Listener &operator=(Listener &&) = delete;

    TransportKind kind() const;

    /**
     * @brief Фактический порт (только для TCP, иначе 0)
     */
    uint16_t port() const;

    /**
     * @brief Адрес, сообщаемый хосту: номер порта для TCP или путь к сокету
     */
    std::string boundAddress() const;

    /**
     * @brief Открыт ли аксептор
     */
    bool isOpen() const;

    /**
     * @brief Системный дескриптор аксептора
     */
    int nativeHandle();

    /**
     * @brief Закрытие аксептора. Повторный вызов ничего не делает
     * @param[out] ec Код ошибки закрытия
     */
    void close(boost::system::error_code &ec);

    TcpAcceptor *tcpAcceptor();
    LocalAcceptor *localAcceptor();

private:
    TransportKind kind_;
    uint16_t port_; // Порт TCP, запомненный при связывании
    std::filesystem::path socketPath_; // Путь к сокету LOCAL
    std::unique_ptr<TcpAcceptor> tcpAcceptor_;
    std::unique_ptr<LocalAcceptor> localAcceptor_;
    bool closed_;

    explicit Listener(TransportKind kind);
};
} // namespace davhost::server

#include <nibble/begin_parse_value.hpp>
#include <nibble/nibble.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <silicium/error_or.hpp>
#include <algorithm>
#include <iostream>

namespace
{
    struct request_line
    {
        std::string method;
        std::string target;
        std::string version;
    };

    bool is_token_character(char const c)
    {
        return (c != ' ') && (c != '\r') && (c != '\n');
    }

    nibble::parser<std::string, request_line> request_line_parser()
    {
        auto const token = nibble::take_while<std::string>(is_token_character);
        auto const space = nibble::element<std::string>(' ');
        return nibble::map(nibble::tuple_of(nibble::before(token, space), nibble::before(token, space),
                                            nibble::before(token, nibble::string("\r\n"))),
                           [](std::tuple<std::string, std::string, std::string> parts)
                           {
                               return request_line{std::move(std::get<0>(parts)), std::move(std::get<1>(parts)),
                                                   std::move(std::get<2>(parts))};
                           });
    }
}

// Sends a request line over a loopback connection in pieces of three bytes
// and parses it on the other end while the pieces arrive.
int main()
{
    using namespace boost::asio;
    io_service io;
    std::string const request = "GET /index.html HTTP/1.0\r\n";
    std::size_t const piece_size = 3;
    int exit_code = 1;

    // server:
    ip::tcp::acceptor acceptor(io, ip::tcp::endpoint(ip::tcp::v4(), 0), true);
    acceptor.listen();
    ip::tcp::socket accepted_socket(io);
    acceptor.async_accept(
        accepted_socket, [&accepted_socket, &exit_code](boost::system::error_code ec)
        {
            Si::throw_if_error(ec);
            nibble::begin_parse_value(
                accepted_socket, request_line_parser(),
                [&exit_code](Si::error_or<nibble::result<std::string, request_line>> const outcome)
                {
                    if (outcome.is_error())
                    {
                        std::cerr << "Could not receive the request: " << outcome.error().message() << '\n';
                        return;
                    }
                    nibble::parse_ok<std::string, request_line> const *const ok = nibble::try_get_ok(outcome.get());
                    if (!ok)
                    {
                        std::cerr << nibble::describe(outcome.get()) << '\n';
                        return;
                    }
                    std::cout << "method: " << ok->value.method << '\n'
                              << "target: " << ok->value.target << '\n'
                              << "version: " << ok->value.version << '\n';
                    exit_code = 0;
                });
        });

    // client:
    ip::tcp::socket connecting_socket(io);
    std::function<void(std::size_t)> send_from = [&](std::size_t const position)
    {
        if (position == request.size())
        {
            connecting_socket.shutdown(ip::tcp::socket::shutdown_send);
            return;
        }
        std::size_t const length = (std::min)(piece_size, request.size() - position);
        async_write(connecting_socket, buffer(request.data() + position, length),
                    [&send_from, position, length](boost::system::error_code ec, std::size_t)
                    {
                        Si::throw_if_error(ec);
                        send_from(position + length);
                    });
    };
    connecting_socket.async_connect(ip::tcp::endpoint(ip::address_v4::loopback(), acceptor.local_endpoint().port()),
                                    [&send_from](boost::system::error_code ec)
                                    {
                                        Si::throw_if_error(ec);
                                        send_from(0);
                                    });

    io.run();
    return exit_code;
}

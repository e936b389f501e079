#include <trickle/async_parse.hpp>
#include <trickle/text.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <silicium/error_or.hpp>
#include <iostream>
#include <sstream>

namespace
{
    std::string describe(trickle::number_value value)
    {
        std::ostringstream description;
        Si::visit<void>(value,
                        [&description](std::int64_t const integer)
                        {
                            description << "integer " << integer;
                        },
                        [&description](double const fractional)
                        {
                            description << "fractional " << fractional;
                        });
        return description.str();
    }

    trickle::parser<char, std::string> next_token()
    {
        return trickle::then(trickle::skip_whitespaces(),
                             trickle::alternative(trickle::map(trickle::word(),
                                                               [](std::string const &found)
                                                               {
                                                                   return "word " + found;
                                                               }),
                                                  trickle::map(trickle::number(), describe)));
    }

    void print_tokens(boost::asio::ip::tcp::socket &socket, beast::streambuf &receive_buffer)
    {
        trickle::async_parse(
            socket, receive_buffer, next_token(),
            [&socket, &receive_buffer](boost::system::error_code ec,
                                       trickle::parse_outcome<char, std::string> outcome)
            {
                Si::throw_if_error(ec);
                Si::visit<void>(outcome,
                                [&socket, &receive_buffer](trickle::success<char, std::string> &parsed)
                                {
                                    std::cout << parsed.value << '\n';
                                    print_tokens(socket, receive_buffer);
                                },
                                [](trickle::failure<char> &failed)
                                {
                                    if (failed.remaining.remaining.empty() &&
                                        (failed.remaining.more == trickle::more_input::complete))
                                    {
                                        std::cout << "end of stream\n";
                                        return;
                                    }
                                    std::cerr << failed << '\n';
                                });
            },
            16);
    }
}

int main()
{
    using namespace boost::asio;
    io_service io;

    // server:
    ip::tcp::acceptor acceptor(io, ip::tcp::endpoint(ip::address_v4::loopback(), 0), true);
    acceptor.listen();
    ip::tcp::socket accepted_socket(io);
    std::string const text = "The quick brown fox jumps over 13 lazy dogs\nat 12.5 km per hour ";
    acceptor.async_accept(accepted_socket, [&accepted_socket, &text](boost::system::error_code ec)
                          {
                              Si::throw_if_error(ec);
                              async_write(accepted_socket, buffer(text),
                                          [&accepted_socket](boost::system::error_code ec, std::size_t)
                                          {
                                              Si::throw_if_error(ec);
                                              accepted_socket.shutdown(ip::tcp::socket::shutdown_send);
                                          });
                          });

    // client:
    ip::tcp::socket connecting_socket(io);
    beast::streambuf receive_buffer;
    connecting_socket.async_connect(ip::tcp::endpoint(ip::address_v4::loopback(), acceptor.local_endpoint().port()),
                                    [&connecting_socket, &receive_buffer](boost::system::error_code ec)
                                    {
                                        Si::throw_if_error(ec);
                                        print_tokens(connecting_socket, receive_buffer);
                                    });

    io.run();
}

/*

capture_email.cpp
-----------------

Embeds the server in a test-like program: starts it on an ephemeral port,
submits a message with a plain socket client and reads it back from the
email channel.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <boost/asio.hpp>
#include <maildock/smtp/email_sink.hpp>
#include <maildock/smtp/server.hpp>


namespace asio = maildock::asio;
using tcp = asio::ip::tcp;
using std::cout;
using std::endl;


static std::string exchange(tcp::socket& sock, asio::streambuf& buf, const std::string& line)
{
    if (!line.empty())
        asio::write(sock, asio::buffer(line + "\r\n"));
    asio::read_until(sock, buf, "\r\n");
    std::istream is(&buf);
    std::string reply;
    std::getline(is, reply);
    if (!reply.empty() && reply.back() == '\r')
        reply.pop_back();
    cout << "S: " << reply << endl;
    return reply;
}


int main()
{
    asio::io_context io_ctx;
    auto [sender, receiver] = maildock::smtp::make_email_channel();

    maildock::smtp::server_options options;
    options.hostname = "capture.local";
    maildock::smtp::server srv(io_ctx, std::move(sender), options);
    srv.listen("127.0.0.1", 0);
    srv.start();
    const unsigned short port = srv.local_endpoint().port();

    std::thread io_thread([&io_ctx] { io_ctx.run(); });

    try
    {
        asio::io_context client_ctx;
        tcp::socket sock(client_ctx);
        sock.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        asio::streambuf buf;

        exchange(sock, buf, "");
        exchange(sock, buf, "HELO client.example.com");
        exchange(sock, buf, "MAIL FROM:<sender@example.com>");
        exchange(sock, buf, "RCPT TO:<recipient@example.com>");
        exchange(sock, buf, "RCPT TO:<another@example.com>");
        exchange(sock, buf, "DATA");
        asio::write(sock, asio::buffer(std::string(
            "From: sender@example.com\r\n"
            "Subject: Test Email from maildock\r\n"
            "\r\n"
            "This is a test email.\r\n")));
        exchange(sock, buf, ".");
        exchange(sock, buf, "QUIT");
    }
    catch (const asio::system_error& exc)
    {
        cout << "Client failed: " << exc.what() << endl;
    }

    if (auto message = receiver.receive_for(std::chrono::seconds(1)))
    {
        cout << "Captured email from " << message->from() << " to " << message->to().size() << " recipient(s)" << endl;
        cout << "Subject: " << message->subject().value_or("(none)") << endl;
        cout << "For another@example.com: " << std::boolalpha << message->has_recipient("another@example.com") << endl;
    }
    else
    {
        cout << "Timeout: no email received within 1 second" << endl;
    }

    srv.stop();
    io_ctx.stop();
    io_thread.join();
    return 0;
}

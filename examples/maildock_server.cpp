/*

maildock_server.cpp
-------------------

Standalone SMTP capture server. Prints every received message.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <maildock/detail/log.hpp>
#include <maildock/smtp/email_sink.hpp>
#include <maildock/smtp/server.hpp>


namespace po = boost::program_options;
using maildock::smtp::email;
using maildock::smtp::make_email_channel;
using maildock::smtp::server;
using maildock::smtp::server_options;
using std::cout;
using std::endl;


static void print_email(std::size_t count, const email& message)
{
    cout << "Received email #" << count << " from: " << message.from() << " to: [";
    for (std::size_t i = 0; i < message.to().size(); ++i)
        cout << (i ? ", " : "") << message.to()[i];
    cout << "]" << endl;
    if (auto subject = message.subject())
        cout << "  Subject: " << *subject << endl;
}


int main(int argc, char* argv[])
{
    std::string listen;
    std::string log_level;
    unsigned idle_timeout = 0;
    server_options options;

    po::options_description desc("maildock_server options");
    desc.add_options()
        ("help,h", "show this help")
        ("listen,l", po::value<std::string>(&listen)->default_value("127.0.0.1:2525"), "address to listen on, host:port")
        ("hostname,n", po::value<std::string>(&options.hostname)->default_value(options.hostname), "name announced in HELO/EHLO replies")
        ("greeting", po::value<std::string>(&options.greeting)->default_value(options.greeting), "text of the 220 banner")
        ("no-ehlo", "answer EHLO as an unknown command")
        ("idle-timeout", po::value<unsigned>(&idle_timeout)->default_value(0), "close silent connections after N seconds, 0 disables")
        ("log-level", po::value<std::string>(&log_level)->default_value("info"), "trace, debug, info, warn, error, fatal or off")
        ("trace", "log every protocol line");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& exc)
    {
        std::cerr << exc.what() << "\n" << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help"))
    {
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    auto level = maildock::log::level_from_string(log_level);
    if (!level)
    {
        std::cerr << "Unknown log level '" << log_level << "'" << endl;
        return EXIT_FAILURE;
    }
    auto& logger = maildock::log::logger::instance();
    logger.set_level(*level);
    logger.set_trace_enabled(vm.count("trace") > 0);

    if (vm.count("no-ehlo"))
        options.enable_ehlo = false;
    if (idle_timeout > 0)
        options.idle_timeout = std::chrono::seconds(idle_timeout);

    cout << "Starting maildock SMTP server..." << endl;
    cout << "Address: " << listen << endl;
    cout << "Hostname: " << options.hostname << endl;

    boost::asio::io_context io_ctx;
    auto [sender, receiver] = make_email_channel();

    try
    {
        server srv(io_ctx, std::move(sender), options);
        srv.listen(listen);
        srv.start();

        std::thread printer([&receiver]
        {
            std::size_t count = 0;
            while (auto message = receiver.receive())
                print_email(++count, *message);
        });

        boost::asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int)
        {
            srv.stop();
            io_ctx.stop();
        });

        io_ctx.run();
        receiver.close();
        printer.join();
    }
    catch (const maildock::server_error& exc)
    {
        std::cerr << "Failed to start server: " << exc.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

/*

test_error_mapping.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_mapping_test

#include <string>
#include <boost/test/unit_test.hpp>

#include <maildock/net/error_mapping.hpp>
#include <maildock/smtp/error_mapping.hpp>
#include <maildock/smtp/limits.hpp>

using maildock::errc;
using maildock::error;
using maildock::smtp::to_response;


static std::string wire(const error& err)
{
    return to_response(err).format();
}


BOOST_AUTO_TEST_CASE(fixed_text_errors)
{
    BOOST_TEST(wire(error(errc::invalid_command)) == "500 Syntax error, command unrecognized\r\n");
    BOOST_TEST(wire(error(errc::transport_failure)) == "421 Service not available\r\n");
    BOOST_TEST(wire(error(errc::invalid_encoding)) == "500 Invalid character encoding\r\n");
    BOOST_TEST(wire(error(errc::connection_closed)) == "421 Connection closed\r\n");
    BOOST_TEST(wire(error(errc::protocol_violation)) == "500 Protocol violation\r\n");
}


BOOST_AUTO_TEST_CASE(detail_errors)
{
    BOOST_TEST(wire(error(errc::invalid_state, "MAIL command requires HELO first")) ==
        "503 Bad sequence of commands: MAIL command requires HELO first\r\n");
    BOOST_TEST(wire(error(errc::invalid_syntax, "MAIL requires FROM argument")) ==
        "501 Syntax error: MAIL requires FROM argument\r\n");
}


BOOST_AUTO_TEST_CASE(limit_errors)
{
    using namespace maildock::smtp;

    BOOST_TEST(wire(error(errc::line_too_long, COMMAND_LINE_MAX_LENGTH)) ==
        "500 Line too long (max 512 characters)\r\n");
    BOOST_TEST(wire(error(errc::line_too_long, TEXT_LINE_MAX_LENGTH)) ==
        "500 Line too long (max 1000 characters)\r\n");
    BOOST_TEST(wire(error(errc::path_too_long, PATH_MAX_LENGTH)) ==
        "501 Path too long (max 256 characters)\r\n");
    BOOST_TEST(wire(error(errc::too_many_recipients, MAX_RECIPIENTS)) ==
        "552 Too many recipients (max 100)\r\n");
    BOOST_TEST(wire(error(errc::too_much_data, MAX_DATA_SIZE)) ==
        "552 Too much mail data (max 10485760 bytes)\r\n");
    BOOST_TEST(wire(error(errc::domain_too_long, DOMAIN_MAX_LENGTH)) ==
        "501 Domain name too long (max 64 characters)\r\n");
    BOOST_TEST(wire(error(errc::user_too_long, USER_MAX_LENGTH)) ==
        "501 User name too long (max 64 characters)\r\n");
}


BOOST_AUTO_TEST_CASE(error_replies_are_errors)
{
    for (auto code : {errc::transport_failure, errc::invalid_command, errc::invalid_state, errc::invalid_syntax,
        errc::line_too_long, errc::path_too_long, errc::too_many_recipients, errc::too_much_data,
        errc::domain_too_long, errc::user_too_long, errc::invalid_encoding, errc::connection_closed,
        errc::protocol_violation})
    {
        BOOST_TEST(to_response(error(code)).is_error());
        BOOST_TEST(std::string(maildock::smtp::reply_code(code)).size() == 3u);
    }
}


BOOST_AUTO_TEST_CASE(net_error_mapping)
{
    namespace asio = maildock::asio;
    using maildock::net::map_net_error;

    BOOST_CHECK(map_net_error(asio::error::eof) == errc::connection_closed);
    BOOST_CHECK(map_net_error(asio::error::connection_reset) == errc::connection_closed);
    BOOST_CHECK(map_net_error(asio::error::broken_pipe) == errc::connection_closed);
    BOOST_CHECK(map_net_error(asio::error::message_size) == errc::line_too_long);
    BOOST_CHECK(map_net_error(asio::error::timed_out) == errc::transport_failure);
    BOOST_CHECK(map_net_error(asio::error::operation_aborted) == errc::transport_failure);

    const auto text = maildock::net::describe_net_error(maildock::net::io_stage::read, asio::error::eof);
    BOOST_TEST(text.rfind("read failed: connection_closed", 0) == 0u);
}

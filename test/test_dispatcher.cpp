/*

test_dispatcher.cpp
-------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE dispatcher_test

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <boost/test/unit_test.hpp>
#include <maildock/smtp/dispatcher.hpp>
#include <maildock/smtp/error_mapping.hpp>

using maildock::errc;
using maildock::smtp::dispatcher;
using maildock::smtp::session;
using maildock::smtp::session_state;
using maildock::smtp::state_name;
using maildock::smtp::to_response;


// Wire form of whatever the dispatcher answers, success or error.
static std::string reply(const dispatcher& d, std::string_view line, session& s)
{
    auto res = d.dispatch(line, s);
    if (!res)
        return to_response(res.error()).format();
    return res->format();
}


BOOST_AUTO_TEST_CASE(greeting_commands)
{
    dispatcher d("mail.local");
    session s;
    BOOST_TEST(reply(d, "HELO client.example.com", s) == "250 mail.local Hello client.example.com\r\n");
    BOOST_CHECK(s.state() == session_state::greeting_received);
    BOOST_TEST(s.client_domain().value() == "client.example.com");

    BOOST_TEST(reply(d, "EHLO other.example.com", s) ==
        "250-mail.local Hello other.example.com\r\n250-PIPELINING\r\n250 SIZE 10485760\r\n");
    BOOST_TEST(s.client_domain().value() == "other.example.com");
}


BOOST_AUTO_TEST_CASE(ehlo_disabled)
{
    dispatcher d("mail.local", false);
    session s;
    BOOST_TEST(reply(d, "EHLO client", s) == "500 Syntax error, command unrecognized\r\n");
    BOOST_CHECK(s.state() == session_state::initial);
    BOOST_TEST(reply(d, "HELO client", s) == "250 mail.local Hello client\r\n");
}


BOOST_AUTO_TEST_CASE(hello_arguments)
{
    dispatcher d("mail.local");
    session s;
    BOOST_TEST(reply(d, "HELO", s) == "501 Syntax error: HELO requires domain argument\r\n");
    BOOST_TEST(reply(d, "HELO a b", s) == "501 Syntax error: HELO takes exactly one domain argument\r\n");
    BOOST_TEST(reply(d, "HELO " + std::string(65, 'd'), s) == "501 Domain name too long (max 64 characters)\r\n");
    BOOST_CHECK(s.state() == session_state::initial);
}


BOOST_AUTO_TEST_CASE(verbs_are_case_insensitive)
{
    dispatcher d("mail.local");
    session s;
    BOOST_TEST(reply(d, "helo client", s) == "250 mail.local Hello client\r\n");
    BOOST_TEST(reply(d, "mail from:<a@example.com>", s) == "250 OK\r\n");
    BOOST_TEST(reply(d, "Rcpt To:<b@example.com>", s) == "250 OK\r\n");
    BOOST_TEST(reply(d, "noop", s) == "250 OK\r\n");
}


BOOST_AUTO_TEST_CASE(unknown_and_empty)
{
    dispatcher d("mail.local");
    session s;
    BOOST_TEST(reply(d, "VRFY someone", s) == "500 Syntax error, command unrecognized\r\n");
    BOOST_TEST(reply(d, "", s) == "500 Syntax error, command unrecognized\r\n");
    BOOST_TEST(reply(d, "   ", s) == "500 Syntax error, command unrecognized\r\n");
}


BOOST_AUTO_TEST_CASE(command_line_limit)
{
    dispatcher d("mail.local");
    session s;
    BOOST_TEST(reply(d, "NOOP " + std::string(507, 'x'), s) == "250 OK\r\n");
    BOOST_TEST(reply(d, "NOOP " + std::string(508, 'x'), s) == "500 Line too long (max 512 characters)\r\n");
}


// Observable session fields, compared before and after a rejected command.
static void check_session(const session& s, std::string_view state, const std::optional<std::string>& domain,
    const std::optional<std::string>& sender, std::size_t recipients)
{
    BOOST_TEST(std::string(state_name(s.state())) == std::string(state));
    BOOST_CHECK(s.client_domain() == domain);
    BOOST_CHECK(s.sender() == sender);
    BOOST_TEST(s.recipients().size() == recipients);
    BOOST_TEST(!s.in_data_mode());
}


BOOST_AUTO_TEST_CASE(ordering_errors)
{
    dispatcher d("mail.local");
    session s;
    BOOST_TEST(reply(d, "MAIL FROM:<a@example.com>", s) ==
        "503 Bad sequence of commands: MAIL command requires HELO first\r\n");
    check_session(s, "initial", std::nullopt, std::nullopt, 0);
    BOOST_TEST(reply(d, "RCPT TO:<a@example.com>", s) ==
        "503 Bad sequence of commands: RCPT command requires MAIL first\r\n");
    check_session(s, "initial", std::nullopt, std::nullopt, 0);
    BOOST_TEST(reply(d, "DATA", s) == "503 Bad sequence of commands: DATA command requires RCPT first\r\n");
    check_session(s, "initial", std::nullopt, std::nullopt, 0);
    BOOST_TEST(reply(d, "RSET", s) == "503 Bad sequence of commands: RSET command requires HELO first\r\n");
    check_session(s, "initial", std::nullopt, std::nullopt, 0);

    BOOST_REQUIRE(d.dispatch("HELO client", s));
    BOOST_TEST(reply(d, "DATA", s) == "503 Bad sequence of commands: DATA command requires RCPT first\r\n");
    check_session(s, "greeting_received", "client", std::nullopt, 0);
    BOOST_TEST(reply(d, "RCPT TO:<b@example.com>", s) ==
        "503 Bad sequence of commands: RCPT command requires MAIL first\r\n");
    check_session(s, "greeting_received", "client", std::nullopt, 0);

    BOOST_REQUIRE(d.dispatch("MAIL FROM:<a@example.com>", s));
    BOOST_TEST(reply(d, "MAIL FROM:<b@example.com>", s) ==
        "503 Bad sequence of commands: MAIL command requires HELO first\r\n");
    check_session(s, "mail_received", "client", "a@example.com", 0);
    BOOST_TEST(reply(d, "DATA", s) == "503 Bad sequence of commands: DATA command requires RCPT first\r\n");
    check_session(s, "mail_received", "client", "a@example.com", 0);

    BOOST_REQUIRE(d.dispatch("RCPT TO:<b@example.com>", s));
    BOOST_TEST(reply(d, "MAIL FROM:<c@example.com>", s) ==
        "503 Bad sequence of commands: MAIL command requires HELO first\r\n");
    check_session(s, "recipients_received", "client", "a@example.com", 1);
}


BOOST_AUTO_TEST_CASE(mail_syntax)
{
    dispatcher d("mail.local");
    session s;
    BOOST_REQUIRE(d.dispatch("HELO client", s));

    BOOST_TEST(reply(d, "MAIL", s) == "501 Syntax error: MAIL requires FROM argument\r\n");
    BOOST_TEST(reply(d, "MAIL TO:<a@example.com>", s) ==
        "501 Syntax error: MAIL command must be 'MAIL FROM:<address>'\r\n");
    BOOST_TEST(reply(d, "MAIL FROM:a@example.com", s) ==
        "501 Syntax error: FROM address must be enclosed in angle brackets\r\n");
    BOOST_TEST(reply(d, "MAIL FROM:<>", s) == "501 Syntax error: FROM address cannot be empty\r\n");
    BOOST_TEST(reply(d, "MAIL FROM:<nobody>", s) == "501 Syntax error: Email address must contain @ symbol\r\n");
    BOOST_TEST(reply(d, "MAIL FROM:<" + std::string(65, 'u') + "@example.com>", s) ==
        "501 User name too long (max 64 characters)\r\n");
    BOOST_CHECK(s.state() == session_state::greeting_received);

    BOOST_TEST(reply(d, "MAIL FROM: <a@example.com>", s) == "250 OK\r\n");
    BOOST_TEST(s.sender().value() == "a@example.com");
}


BOOST_AUTO_TEST_CASE(rcpt_syntax_and_limit)
{
    dispatcher d("mail.local");
    session s;
    BOOST_REQUIRE(d.dispatch("HELO client", s));
    BOOST_REQUIRE(d.dispatch("MAIL FROM:<a@example.com>", s));

    BOOST_TEST(reply(d, "RCPT", s) == "501 Syntax error: RCPT requires TO argument\r\n");
    BOOST_TEST(reply(d, "RCPT FROM:<b@example.com>", s) ==
        "501 Syntax error: RCPT command must be 'RCPT TO:<address>'\r\n");

    for (int i = 0; i < 100; ++i)
        BOOST_REQUIRE(d.dispatch("RCPT TO:<r" + std::to_string(i) + "@example.com>", s));
    BOOST_TEST(reply(d, "RCPT TO:<late@example.com>", s) == "552 Too many recipients (max 100)\r\n");
    BOOST_TEST(s.recipient_count() == 100u);
}


BOOST_AUTO_TEST_CASE(data_and_rset)
{
    dispatcher d("mail.local");
    session s;
    BOOST_REQUIRE(d.dispatch("HELO client", s));
    BOOST_REQUIRE(d.dispatch("MAIL FROM:<a@example.com>", s));
    BOOST_REQUIRE(d.dispatch("RCPT TO:<b@example.com>", s));

    BOOST_TEST(reply(d, "DATA now", s) == "501 Syntax error: DATA command takes no arguments\r\n");
    BOOST_TEST(reply(d, "RSET", s) == "250 OK\r\n");
    BOOST_CHECK(s.state() == session_state::greeting_received);
    BOOST_TEST(!s.sender().has_value());

    BOOST_REQUIRE(d.dispatch("MAIL FROM:<a@example.com>", s));
    BOOST_REQUIRE(d.dispatch("RCPT TO:<b@example.com>", s));
    BOOST_TEST(reply(d, "DATA", s) == "354 End data with <CR><LF>.<CR><LF>\r\n");
    BOOST_TEST(s.in_data_mode());
}


BOOST_AUTO_TEST_CASE(quit_and_noop)
{
    dispatcher d("mail.local");
    session s;
    auto res = d.dispatch("NOOP", s);
    BOOST_REQUIRE(res);
    BOOST_TEST(res->format() == "250 OK\r\n");

    res = d.dispatch("QUIT", s);
    BOOST_REQUIRE(res);
    BOOST_TEST(res->format() == "221 Bye\r\n");
    BOOST_TEST(res->closes_connection());
}


BOOST_AUTO_TEST_CASE(options_constructor)
{
    maildock::smtp::server_options opts;
    opts.hostname = "custom.local";
    opts.capabilities = {"8BITMIME"};
    dispatcher d(opts);
    session s;
    BOOST_TEST(d.hostname() == "custom.local");
    BOOST_TEST(reply(d, "EHLO c", s) == "250-custom.local Hello c\r\n250 8BITMIME\r\n");
}


BOOST_AUTO_TEST_CASE(rset_after_sender_only)
{
    dispatcher d("mail.local");
    session s;
    BOOST_REQUIRE(d.dispatch("HELO a.example", s));
    BOOST_REQUIRE(d.dispatch("MAIL FROM:<aborted@example.com>", s));
    BOOST_TEST(reply(d, "RSET", s) == "250 OK\r\n");
    BOOST_TEST(!s.sender().has_value());
    BOOST_TEST(s.client_domain().value() == "a.example");

    BOOST_TEST(reply(d, "MAIL FROM:<s@e.com>", s) == "250 OK\r\n");
    BOOST_TEST(reply(d, "RCPT TO:<r@e.com>", s) == "250 OK\r\n");
    BOOST_TEST(reply(d, "DATA", s) == "354 End data with <CR><LF>.<CR><LF>\r\n");
    BOOST_REQUIRE(d.collect("Subject: X", s));
    BOOST_REQUIRE(d.collect("", s));
    BOOST_REQUIRE(d.collect("Body", s));
    auto done = d.collect(".", s);
    BOOST_REQUIRE(done);
    BOOST_REQUIRE(done->has_value());
    BOOST_TEST((*done)->from() == "s@e.com");
    BOOST_TEST((*done)->to().size() == 1u);
    BOOST_TEST((*done)->to().front() == "r@e.com");
    BOOST_TEST((*done)->data() == "Subject: X\n\nBody");
}

/*

test_email.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE email_test

#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>
#include <maildock/smtp/email.hpp>

using maildock::smtp::email;


static email sample(std::string data)
{
    return email("sender@example.com", {"one@example.com", "two@example.com"}, std::move(data));
}


BOOST_AUTO_TEST_CASE(envelope_queries)
{
    const auto msg = sample("Subject: Hi\n\nbody");
    BOOST_TEST(msg.from() == "sender@example.com");
    BOOST_TEST(msg.to().size() == 2u);
    BOOST_TEST(msg.has_recipient("two@example.com"));
    BOOST_TEST(!msg.has_recipient("three@example.com"));
    BOOST_TEST(msg.is_from_sender("sender@example.com"));
    BOOST_TEST(!msg.is_from_sender("Sender@example.com"));
    BOOST_TEST(msg.data_size() == msg.data().size());
    BOOST_TEST(msg.contains_text("body"));
    BOOST_TEST(!msg.contains_text("missing"));
}


BOOST_AUTO_TEST_CASE(subject_header)
{
    BOOST_TEST(sample("From: a@b\nSubject: Test Email\n\nHello").subject().value() == "Test Email");
    BOOST_TEST(sample("subject: lower\n\nHello").subject().value() == "lower");
    BOOST_TEST(sample("Subject: first\nSubject: second\n\n").subject().value() == "first");
    BOOST_TEST(!sample("From: a@b\n\nSubject: in body").subject().has_value());
    BOOST_TEST(!sample("").subject().has_value());
}


BOOST_AUTO_TEST_CASE(body_after_blank_line)
{
    BOOST_TEST(sample("Subject: x\n\nline one\nline two").body().value() == "line one\nline two");
    BOOST_TEST(!sample("Subject: x\nno separator").body().has_value());
    BOOST_TEST(!sample("Subject: x\n\n").body().has_value());
    BOOST_TEST(sample("\nonly body").body().value() == "only body");
}


BOOST_AUTO_TEST_CASE(received_timestamp)
{
    const auto before = email::clock::now();
    const auto msg = sample("x");
    BOOST_TEST((msg.received_at() >= before));
    BOOST_TEST((msg.received_at() <= email::clock::now()));
}

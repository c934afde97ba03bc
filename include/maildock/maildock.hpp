#pragma once

#include <maildock/config.hpp>

#include <maildock/detail/log.hpp>
#include <maildock/detail/result.hpp>
#include <maildock/detail/utf8.hpp>

#include <maildock/net/dialog.hpp>
#include <maildock/net/error_mapping.hpp>

#include <maildock/smtp/limits.hpp>
#include <maildock/smtp/types.hpp>
#include <maildock/smtp/response.hpp>
#include <maildock/smtp/error_mapping.hpp>
#include <maildock/smtp/email.hpp>
#include <maildock/smtp/email_sink.hpp>
#include <maildock/smtp/state.hpp>
#include <maildock/smtp/session.hpp>
#include <maildock/smtp/address.hpp>
#include <maildock/smtp/dispatcher.hpp>
#include <maildock/smtp/connection.hpp>
#include <maildock/smtp/server.hpp>

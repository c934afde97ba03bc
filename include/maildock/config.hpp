/*

config.hpp
----------

Global build configuration for maildock.

Define MAILDOCK_NO_EHLO to compile out the EHLO capability announcement;
the verb is then answered as an unknown command.

*/

#pragma once

#if defined(MAILDOCK_NO_EHLO)
#define MAILDOCK_EHLO_ENABLED 0
#else
#define MAILDOCK_EHLO_ENABLED 1
#endif

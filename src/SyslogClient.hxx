// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "net/UniqueSocketDescriptor.hxx"

#include <string>
#include <string_view>

/**
 * Sends messages to a syslog daemon over a datagram socket.
 */
class SyslogClient {
	UniqueSocketDescriptor fd;
	const std::string me, ident;
	const int facility;

public:
	/**
	 * @param _me the host name to be included in each message;
	 * empty to omit it (for the local syslog socket)
	 */
	SyslogClient(UniqueSocketDescriptor _fd,
		     std::string_view _me, std::string_view _ident,
		     int _facility)
		:fd(std::move(_fd)), me(_me), ident(_ident), facility(_facility) {}

	/**
	 * Connect to a local socket (if #server starts with a slash)
	 * or to a remote host (default port 514).
	 *
	 * Throws std::runtime_error on error.
	 */
	SyslogClient(const char *server,
		     std::string_view _ident, int _facility);

	SyslogClient(SyslogClient &&src) = default;

	/**
	 * @return 0 on success, an errno value on error
	 */
	int Log(int priority, std::string_view msg) noexcept;
};

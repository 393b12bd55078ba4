// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SyslogClient.hxx"
#include "net/RConnectSocket.hxx"
#include "net/AllocatedSocketAddress.hxx"
#include "net/SocketError.hxx"
#include "io/Iovec.hxx"

#include <fmt/format.h>

#include <array>
#include <cassert>
#include <span>

#include <errno.h>
#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

static UniqueSocketDescriptor
ConnectLocalDatagramSocket(const char *path)
{
	AllocatedSocketAddress address;
	address.SetLocal(path);

	UniqueSocketDescriptor fd;
	if (!fd.Create(AF_LOCAL, SOCK_DGRAM, 0))
		throw MakeSocketError("Failed to create socket");

	if (!fd.Connect(address))
		throw MakeSocketError(fmt::format("Failed to connect to {}",
						  path).c_str());

	return fd;
}

static std::string
GetHostName() noexcept
{
	char name[256];
	if (gethostname(name, sizeof(name)) < 0)
		return "localhost";

	name[sizeof(name) - 1] = 0;
	return name;
}

static SyslogClient
MakeSyslogClient(const char *server, std::string_view ident, int facility)
{
	if (*server == '/')
		return {ConnectLocalDatagramSocket(server), {}, ident, facility};

	return {
		ResolveConnectDatagramSocket(server, 514),
		GetHostName(), ident, facility,
	};
}

SyslogClient::SyslogClient(const char *server,
			   std::string_view _ident, int _facility)
	:SyslogClient(MakeSyslogClient(server, _ident, _facility))
{
}

static constexpr struct iovec
MakeIovec(const std::string_view value) noexcept
{
	return MakeIovec(std::span{value});
}

int
SyslogClient::Log(int priority, std::string_view msg) noexcept
{
	static constexpr char space = ' ';
	static constexpr char newline = '\n';
	static constexpr std::string_view colon = ": ";

	assert(fd.IsDefined());
	assert(priority >= 0 && priority < 8);

	std::array<char, 16> code;
	const auto code_end = fmt::format_to_n(code.data(), code.size(),
					       "<{}>", facility * 8 + priority).out;
	const std::string_view code_sv{code.data(), code_end};

	struct iovec iovec[] = {
		MakeIovec(code_sv),
		MakeIovec(me),
		MakeIovecT(space),
		MakeIovec(ident),
		MakeIovec(colon),
		MakeIovec(msg),
		MakeIovecT(newline),
	};

	if (me.empty())
		/* omit host name and the space after it */
		iovec[2].iov_len = 0;

	const ssize_t nbytes = writev(fd.Get(), iovec, std::size(iovec));
	if (nbytes < 0)
		return errno;

	if (nbytes == 0)
		return -1;

	return 0;
}

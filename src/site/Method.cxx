// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Method.hxx"

using std::string_view_literals::operator""sv;

std::optional<SiteMethod>
ParseSiteMethod(std::string_view s) noexcept
{
	if (s == "wp-cli"sv)
		return SiteMethod::WP_CLI;
	else if (s == "php-direct"sv)
		return SiteMethod::PHP_DIRECT;
	else
		return std::nullopt;
}

std::string_view
ToString(SiteMethod method) noexcept
{
	switch (method) {
	case SiteMethod::WP_CLI:
		return "wp-cli"sv;

	case SiteMethod::PHP_DIRECT:
		return "php-direct"sv;
	}

	return {};
}

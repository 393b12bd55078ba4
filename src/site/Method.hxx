// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

/**
 * How the cron handler of a site is invoked.
 */
enum class SiteMethod : uint_least8_t {
	/**
	 * Run "wp cron event run --all" through the PHP CLI.
	 */
	WP_CLI,

	/**
	 * Run the site's "wp-cron.php" through the PHP CLI.
	 */
	PHP_DIRECT,
};

/**
 * Parse the registry spelling of a method ("wp-cli" or
 * "php-direct").  Returns std::nullopt if the string is not
 * recognized.
 */
[[gnu::pure]]
std::optional<SiteMethod>
ParseSiteMethod(std::string_view s) noexcept;

[[gnu::const]]
std::string_view
ToString(SiteMethod method) noexcept;

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Registry.hxx"
#include "report/LogSink.hxx"
#include "lib/fmt/SystemError.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringStrip.hxx"

#include <fmt/core.h>

#include <array>
#include <set>

#include <errno.h>
#include <unistd.h>
#include <sys/stat.h>

using std::string_view_literals::operator""sv;

/**
 * Registry files larger than this are rejected.
 */
static constexpr std::size_t MAX_REGISTRY_SIZE = 1024 * 1024;

static constexpr std::size_t N_FIELDS = 3;

[[gnu::pure]]
static bool
IsCommentOrBlank(std::string_view line) noexcept
{
	return line.empty() || line.front() == '#';
}

LoadedRegistry
ParseRegistry(std::string_view text, std::size_t max_entries)
{
	LoadedRegistry result;

	std::set<std::string_view, std::less<>> seen_paths;

	unsigned line_number = 0;
	for (std::string_view line : IterableSplitString(text, '\n')) {
		++line_number;

		line = Strip(line);
		if (IsCommentOrBlank(line))
			continue;

		if (++result.n_entries > max_entries)
			throw ConfigError(ConfigError::Code::TOO_MANY_ENTRIES,
					  fmt::format("Too many sites in registry (more than {})",
						      max_entries));

		std::array<std::string_view, N_FIELDS> fields{};
		std::size_t n_fields = 0;
		for (std::string_view field : IterableSplitString(line, '|')) {
			if (n_fields < fields.size())
				fields[n_fields] = Strip(field);
			++n_fields;
		}

		const auto [path, owner, method_string] = fields;

		if (n_fields != N_FIELDS || path.empty() ||
		    owner.empty() || method_string.empty()) {
			result.invalid.emplace_back(JobOutcome::Invalid(line_number,
									path, owner,
									fmt::format("Invalid registry line {}: expected path|user|method",
										    line_number)));
			continue;
		}

		const auto method = ParseSiteMethod(method_string);
		if (!method) {
			result.invalid.emplace_back(JobOutcome::Invalid(line_number,
									path, owner,
									fmt::format("Unknown method {:?}",
										    method_string)));
			continue;
		}

		if (!seen_paths.emplace(path).second) {
			result.invalid.emplace_back(JobOutcome::Invalid(line_number,
									path, owner,
									"Duplicate registry entry"));
			continue;
		}

		result.records.push_back({
			.path = std::string{path},
			.owner = std::string{owner},
			.method = *method,
			.line = line_number,
		});
	}

	return result;
}

static std::string
ReadRegistryFile(FileDescriptor fd, const char *path)
{
	std::string text;

	while (true) {
		char buffer[16384];
		const auto nbytes = read(fd.Get(), buffer, sizeof(buffer));
		if (nbytes < 0)
			throw FmtErrno("Failed to read {:?}", path);

		if (nbytes == 0)
			break;

		if (text.size() + std::size_t(nbytes) > MAX_REGISTRY_SIZE)
			throw ConfigError(ConfigError::Code::TOO_LARGE,
					  fmt::format("Registry file {:?} is too large",
						      path));

		text.append(buffer, nbytes);
	}

	return text;
}

/**
 * Mode bits which must not be set on the registry file (everything
 * except owner read/write).
 */
static constexpr mode_t FORBIDDEN_MODE_BITS = 07777 & ~mode_t(0600);

LoadedRegistry
LoadRegistry(const RegistryConfig &config, LogSink &log)
{
	const char *const path = config.path.c_str();

	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path)) {
		if (errno == ENOENT)
			throw ConfigError(ConfigError::Code::NOT_FOUND,
					  fmt::format("Sites registry not found: {}",
						      path));

		throw FmtErrno("Failed to open {:?}", path);
	}

	/* all checks are done on the opened file descriptor, so the
	   file cannot be replaced between checking and reading */

	struct stat st;
	if (fstat(fd.Get(), &st) < 0)
		throw FmtErrno("Failed to stat {:?}", path);

	if (!S_ISREG(st.st_mode))
		throw ConfigError(ConfigError::Code::NOT_FOUND,
				  fmt::format("Sites registry is not a regular file: {}",
					      path));

	if (st.st_uid != config.trusted_uid)
		throw ConfigError(ConfigError::Code::UNTRUSTED_OWNER,
				  fmt::format("Sites registry {} must be owned by uid {} (currently: {})",
					      path, config.trusted_uid, st.st_uid));

	if (const mode_t mode = st.st_mode & 07777;
	    (mode & FORBIDDEN_MODE_BITS) != 0) {
		const mode_t tightened = mode & ~FORBIDDEN_MODE_BITS;

		log.Log(LOG_WARNING,
			fmt::format("WARNING: Sites registry permissions should be 600 (currently: {:o}), changing to {:o}",
				    mode, tightened));

		if (fchmod(fd.Get(), tightened) < 0)
			throw FmtErrno("Failed to change permissions of {:?}",
				       path);
	}

	return ParseRegistry(ReadRegistryFile(fd, path), config.max_entries);
}

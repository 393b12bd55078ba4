#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

/**
 * A temporary directory which is deleted with all its contents by
 * the destructor.
 */
class TempDir {
	std::string path;

public:
	TempDir() {
		const char *tmp = getenv("TMPDIR");
		std::string pattern = tmp != nullptr && *tmp != 0 ? tmp : "/tmp";
		pattern += "/wp-cron-runner-test.XXXXXX";

		if (mkdtemp(pattern.data()) == nullptr)
			throw std::runtime_error{"mkdtemp() failed"};

		/* resolve symlinks so the path can be used as an
		   allowed root */
		path = std::filesystem::canonical(pattern).string();
	}

	~TempDir() noexcept {
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}

	TempDir(const TempDir &) = delete;
	TempDir &operator=(const TempDir &) = delete;

	const std::string &GetPath() const noexcept {
		return path;
	}

	std::string Child(std::string_view name) const {
		std::string result = path;
		result.push_back('/');
		result.append(name);
		return result;
	}

	std::string MakeDirectory(std::string_view name) const {
		auto p = Child(name);
		if (mkdir(p.c_str(), 0755) < 0)
			throw std::runtime_error{"mkdir() failed"};
		return p;
	}

	std::string WriteFile(std::string_view name, std::string_view contents,
			      mode_t mode=0600) const {
		auto p = Child(name);
		int fd = open(p.c_str(), O_WRONLY|O_CREAT|O_TRUNC, mode);
		if (fd < 0)
			throw std::runtime_error{"open() failed"};

		const bool ok = write(fd, contents.data(), contents.size()) == ssize_t(contents.size());
		close(fd);
		if (!ok)
			throw std::runtime_error{"write() failed"};

		/* the umask may have removed bits */
		chmod(p.c_str(), mode);
		return p;
	}
};

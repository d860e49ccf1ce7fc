#include "env.h"
#include "mcregion/errors.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>

namespace mcregion {

	FileEnvironment::FileEnvironment(const std::string& path, const EnvOptions& opts)
		: path_(path), opts_(opts)
	{
		struct stat statbuf;
		int res = ::stat(path.c_str(), &statbuf);
		if (res == -1 and errno == ENOENT) {
			fileIsNew_ = true;
		} else if (res == -1) {
			int e = errno;
			fmt::print(stderr, " - stat failed with: {}, {}\n", e, strerror(e));
			throw BadFileError(path, "stat", e);
		} else {
			mtimeMillis_ = static_cast<int64_t>(statbuf.st_mtim.tv_sec) * 1000 + statbuf.st_mtim.tv_nsec / 1'000'000;
		}

		if (opts.readonly and fileIsNew_) {
			throw RegionError(ErrorKind::NotFound, fmt::format("file '{}' must already exist when opened read-only", path));
		}

		auto flags = opts.readonly ? O_RDONLY : O_RDWR;
		if (not opts.readonly) flags |= O_CREAT;
		auto mode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH;
		fd_ = ::open(path.c_str(), flags | O_CLOEXEC, mode);
		if (fd_ == -1) {
			int e = errno;
			fmt::print(stderr, " - open failed with: {}, {}\n", e, strerror(e));
			throw BadFileError(path, "open", e);
		}
	}

	FileEnvironment::~FileEnvironment() {
		if (fd_ >= 0) {
			try {
				close();
			} catch (const std::exception& e) {
				fmt::print(stderr, fmt::fg(fmt::color::red), " - [~FileEnvironment] close of '{}' failed: {}\n", path_, e.what());
			}
		}
	}

	uint64_t FileEnvironment::length() const {
		struct stat statbuf;
		if (::fstat(fd_, &statbuf) == -1) throw BadFileError(path_, "fstat", errno);
		return static_cast<uint64_t>(statbuf.st_size);
	}

	size_t FileEnvironment::readAt(uint64_t offset, void* dst, size_t n) const {
		size_t done = 0;
		char* out = static_cast<char*>(dst);
		while (done < n) {
			ssize_t r = ::pread(fd_, out + done, n - done, static_cast<off_t>(offset + done));
			if (r == -1) {
				if (errno == EINTR) continue;
				throw BadFileError(path_, "pread", errno);
			}
			if (r == 0) break;
			done += static_cast<size_t>(r);
		}
		return done;
	}

	void FileEnvironment::writeAt(uint64_t offset, const void* src, size_t n) {
		size_t done = 0;
		const char* in = static_cast<const char*>(src);
		while (done < n) {
			ssize_t r = ::pwrite(fd_, in + done, n - done, static_cast<off_t>(offset + done));
			if (r == -1) {
				if (errno == EINTR) continue;
				throw BadFileError(path_, "pwrite", errno);
			}
			done += static_cast<size_t>(r);
		}
	}

	void FileEnvironment::writeZeros(uint64_t offset, size_t n) {
		static const std::vector<char> zeros(1 << 16, 0);
		while (n > 0) {
			size_t m = std::min(n, zeros.size());
			writeAt(offset, zeros.data(), m);
			offset += m;
			n -= m;
		}
	}

	void FileEnvironment::sync() {
		if (::fsync(fd_) == -1) throw BadFileError(path_, "fsync", errno);
	}

	void FileEnvironment::close() {
		if (fd_ < 0) return;

		int fd = fd_;
		fd_ = -1;

		if (not opts_.readonly and opts_.syncOnClose and ::fsync(fd) == -1) {
			int e = errno;
			::close(fd);
			throw BadFileError(path_, "fsync", e);
		}

		if (::close(fd) == -1) {
			throw BadFileError(path_, "close", errno);
		}
	}

}

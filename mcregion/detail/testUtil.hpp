#pragma once

#include "mcregion/errors.h"

#include <fmt/core.h>

#include <cerrno>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace mcregion {

	// A region-named path in /tmp, removed on construction and destruction.
	struct TmpRegionPath {
		std::string path;

		inline TmpRegionPath(const std::string& tag, int rx=0, int rz=0)
			: path(fmt::format("/tmp/mcregionTest_{}_{}.{}.{}.mcr", tag, getpid(), rx, rz)) {
			unlink(path.c_str());
		}
		inline ~TmpRegionPath() {
			unlink(path.c_str());
		}
		inline operator const std::string&() const { return path; }
	};

	// Half repetitive, half random, so it compresses a bit but not to nothing.
	inline std::vector<uint8_t> makeChunkData(size_t n, uint32_t seed) {
		std::mt19937 rng(seed);
		std::vector<uint8_t> out(n);
		for (size_t i=0; i<n; i++) out[i] = (i / 64) % 2 ? static_cast<uint8_t>(rng()) : static_cast<uint8_t>(i);
		return out;
	}

	inline std::optional<ErrorKind> errorKindOf(const std::function<void()>& f) {
		try {
			f();
		} catch (const RegionError& e) {
			return e.kind();
		}
		return {};
	}

	inline uint64_t fileLength(const std::string& path) {
		struct stat st;
		if (::stat(path.c_str(), &st) != 0) return 0;
		return static_cast<uint64_t>(st.st_size);
	}

	inline void pokeBytes(const std::string& path, uint64_t offset, const std::vector<uint8_t>& bytes) {
		int fd = ::open(path.c_str(), O_RDWR | O_CREAT, 0644);
		if (fd == -1) throw BadFileError(path, "open", errno);
		ssize_t n = ::pwrite(fd, bytes.data(), bytes.size(), static_cast<off_t>(offset));
		::close(fd);
		if (n != static_cast<ssize_t>(bytes.size())) throw BadFileError(path, "pwrite", errno);
	}

	inline void pokeBigEndian32(const std::string& path, uint64_t offset, uint32_t v) {
		pokeBytes(path, offset, { uint8_t(v >> 24), uint8_t(v >> 16), uint8_t(v >> 8), uint8_t(v) });
	}

}

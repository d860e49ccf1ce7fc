#pragma once

#include "mcregion/errors.h"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace mcregion {

constexpr int      RegionWidth      = 32;
constexpr int      ChunksPerRegion  = RegionWidth * RegionWidth;
constexpr uint32_t SectorBytes      = 4096;
constexpr uint32_t HeaderSectors    = 2;
constexpr uint32_t ChunkHeaderBytes = 5; // u32 length + u8 version
constexpr uint32_t MaxSectorsPerChunk = 255;

static_assert(ChunksPerRegion * sizeof(uint32_t) == SectorBytes);

// Region coordinate of a chunk coordinate. Floor division: -1 maps to -1, not 0.
inline int32_t chunkToRegion(int32_t c) {
	return c >= 0 ? c / RegionWidth : -((-(int64_t)c + RegionWidth - 1) / RegionWidth);
}

// Position of a chunk inside its region, always in [0,32).
inline int32_t chunkToLocal(int32_t c) {
	return c - chunkToRegion(c) * RegionWidth;
}

inline bool outOfBounds(int x, int z) {
	return x < 0 or x >= RegionWidth or z < 0 or z >= RegionWidth;
}

inline int chunkIndex(int x, int z) {
	return x + z * RegionWidth;
}

struct RegionCoordinate {
	int32_t x = 0;
	int32_t z = 0;

	inline bool operator==(const RegionCoordinate& o) const { return x == o.x and z == o.z; }
	inline bool operator!=(const RegionCoordinate& o) const { return not (*this == o); }

	static inline RegionCoordinate fromChunk(int32_t cx, int32_t cz) {
		return RegionCoordinate { chunkToRegion(cx), chunkToRegion(cz) };
	}
};

inline std::string regionFileName(int32_t rx, int32_t rz, const std::string& ext="mcr") {
	return fmt::format("r.{}.{}.{}", rx, rz, ext);
}

//
// Parses the region coordinates out of a file name such as "r.-3.7.mcr".
// Leading directories are ignored. The second and third dot-separated fields
// are the coordinates, whatever the first field and the extension are.
//
inline RegionCoordinate parseRegionName(const std::string& path) {
	std::string name = path;
	auto slash = name.find_last_of('/');
	if (slash != std::string::npos) name = name.substr(slash+1);

	std::vector<std::string> parts;
	size_t start = 0;
	while (true) {
		auto dot = name.find('.', start);
		parts.push_back(name.substr(start, dot == std::string::npos ? std::string::npos : dot-start));
		if (dot == std::string::npos) break;
		start = dot + 1;
	}

	if (parts.size() < 3)
		throw RegionError(ErrorKind::BadRegionName, fmt::format("'{}' does not look like r.<x>.<z>.<ext>", name));

	auto parseField = [&name](const std::string& s) -> int32_t {
		if (s.empty()) throw RegionError(ErrorKind::BadRegionName, fmt::format("empty coordinate in '{}'", name));
		char* end = nullptr;
		long v = std::strtol(s.c_str(), &end, 10);
		if (*end != '\0' or v < INT32_MIN or v > INT32_MAX)
			throw RegionError(ErrorKind::BadRegionName, fmt::format("bad coordinate '{}' in '{}'", s, name));
		return static_cast<int32_t>(v);
	};

	return RegionCoordinate { parseField(parts[1]), parseField(parts[2]) };
}

}

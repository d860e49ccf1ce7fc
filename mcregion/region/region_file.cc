#include "region_file.h"
#include "chunk_buffer.h"
#include "mcregion/detail/bytes.hpp"

#include <fmt/core.h>
#include <fmt/color.h>

#include <chrono>
#include <cstring>

namespace {
	using namespace mcregion;

	EnvOptions envOptionsFor(const RegionOptions& opts) {
		EnvOptions o;
		o.readonly    = opts.readonly;
		o.syncOnClose = opts.syncOnClose;
		return o;
	}
}

namespace mcregion {

	RegionFile::RegionFile(const std::string& path, const RegionOptions& opts)
		: path_(path),
		  opts_(opts),
		  coord_(parseRegionName(path)),
		  env_(path, envOptionsFor(opts)),
		  tables_(env_)
	{
		lastModified_ = env_.mtimeMillis();

		uint64_t len = env_.length();

		if (not opts_.readonly) {
			if (len < HeaderTables::tablesLength) {
				// Too short to hold both tables: start over with empty ones.
				tables_.initialize();
				sizeDelta_ += HeaderTables::tablesLength - len;
				len = HeaderTables::tablesLength;
			}

			if (len % SectorBytes != 0) {
				uint64_t pad = SectorBytes - len % SectorBytes;
				env_.writeZeros(len, pad);
				sizeDelta_ += pad;
				len += pad;
			}
		}

		tables_.load();

		// Entries pointing past the end of the file or into the header are left out of
		// the map and remembered in unmapped_. They are only reported (InvalidSector)
		// when that cell is read, and never own any sectors, even once the file has grown.
		size_t nsectors = len / SectorBytes;
		sectors_ = SectorMap(nsectors, HeaderSectors);
		int skipped = 0;
		for (int i=0; i<ChunksPerRegion; i++) {
			if (tables_.rawOffset(i) == 0) continue;
			Location loc = tables_.location(i);
			if (loc.sectorNumber >= HeaderSectors and loc.end() <= nsectors) {
				sectors_.mark(loc.sectorNumber, loc.sectorCount, false);
			} else {
				unmapped_.set(i);
				skipped++;
			}
		}

		if (opts_.verbose) {
			fmt::print(" - REGION LOAD {} ({},{}) {} sectors, {} chunks{}\n",
					path_, coord_.x, coord_.z, nsectors, tables_.usedCount(), opts_.readonly ? ", readonly" : "");
			if (skipped)
				fmt::print(fmt::fg(fmt::color::yellow), " - REGION LOAD {}: {} entries point outside the file\n", path_, skipped);
		}
	}

	RegionFile::~RegionFile() {
		if (not closed_) {
			try {
				close();
			} catch (const std::exception& e) {
				fmt::print(stderr, fmt::fg(fmt::color::red), " - [~RegionFile] close of '{}' failed: {}\n", path_, e.what());
			}
		}
	}

	void RegionFile::checkOpen() const {
		if (closed_) throw RegionError(ErrorKind::Closed, path_);
	}

	void RegionFile::checkWritable(int x, int z) const {
		if (opts_.readonly)
			throw RegionError(ErrorKind::ReadOnlyViolation, fmt::format("{} is open read-only", path_));
		if (outOfBounds(x, z))
			throw RegionError(ErrorKind::OutOfBounds, fmt::format("chunk ({},{}) is outside the 32x32 grid", x, z));
	}

	uint32_t RegionFile::now() const {
		auto secs = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch());
		return static_cast<uint32_t>(secs.count());
	}

	std::optional<ChunkStream> RegionFile::read(int x, int z) {
		if (outOfBounds(x, z)) {
			if (opts_.verbose) fmt::print(" - REGION READ {} [{},{}] out of bounds\n", path_, x, z);
			return {};
		}

		std::lock_guard<std::mutex> lck(mtx_);
		checkOpen();

		int idx = chunkIndex(x, z);
		uint32_t raw = tables_.rawOffset(idx);
		if (raw == 0) return {};

		Location loc = Location::unpack(raw);
		if (unmapped_.test(idx) or loc.end() > sectors_.size()) {
			if (opts_.verbose) fmt::print(" - REGION READ {} [{},{}] invalid sector\n", path_, x, z);
			throw RegionError(ErrorKind::InvalidSector,
					fmt::format("READ {},{}: sectors [{}, {}) outside of {} in region {},{}",
						x, z, loc.sectorNumber, loc.end(), sectors_.size(), coord_.x, coord_.z));
		}

		uint64_t pos = static_cast<uint64_t>(loc.sectorNumber) * SectorBytes;
		uint8_t header[ChunkHeaderBytes];
		size_t got = env_.readAt(pos, header, ChunkHeaderBytes);
		uint32_t length = got >= 4 ? loadBigEndian32(header) : 0;

		if (length > SectorBytes * loc.sectorCount or length < 1 or got < ChunkHeaderBytes) {
			if (opts_.verbose) fmt::print(" - REGION READ {} [{},{}] invalid length: {} > 4096 * {}\n", path_, x, z, length, loc.sectorCount);
			throw RegionError(ErrorKind::InvalidLength,
					fmt::format("READ {},{}: invalid length: {} > 4096 * {} in region {},{}",
						x, z, length, loc.sectorCount, coord_.x, coord_.z));
		}

		uint8_t version = header[4];
		std::vector<uint8_t> payload(length - 1);
		got = env_.readAt(pos + ChunkHeaderBytes, payload.data(), payload.size());
		if (got != payload.size()) {
			throw RegionError(ErrorKind::InvalidLength,
					fmt::format("READ {},{}: file ends {} bytes into a {} byte chunk in region {},{}",
						x, z, got, payload.size(), coord_.x, coord_.z));
		}

		return decodeChunk(version, std::move(payload));
	}

	std::optional<std::vector<uint8_t>> RegionFile::readAll(int x, int z) {
		auto stream = read(x, z);
		if (not stream) return {};
		return stream->readAll();
	}

	bool RegionFile::contains(int x, int z) {
		if (outOfBounds(x, z)) return false;

		std::lock_guard<std::mutex> lck(mtx_);
		checkOpen();
		return tables_.rawOffset(chunkIndex(x, z)) != 0;
	}

	void RegionFile::writeSectors(uint32_t sectorNumber, const void* data, size_t len) {
		std::vector<uint8_t> buf(ChunkHeaderBytes + len);
		storeBigEndian32(buf.data(), static_cast<uint32_t>(len + 1));
		buf[4] = DefaultCodecVersion;
		if (len) memcpy(buf.data() + ChunkHeaderBytes, data, len);
		env_.writeAt(static_cast<uint64_t>(sectorNumber) * SectorBytes, buf.data(), buf.size());
	}

	void RegionFile::releaseRun(int idx) {
		Location loc = tables_.location(idx);
		// Runs that were never entered into the map at load are not released either.
		if (loc.empty() or unmapped_.test(idx)) return;
		sectors_.mark(loc.sectorNumber, loc.sectorCount, true);
	}

	void RegionFile::write(int x, int z, const void* data, size_t len) {
		checkWritable(x, z);

		size_t needed = sectorsNeeded(len);
		if (needed > MaxSectorsPerChunk) {
			throw RegionError(ErrorKind::ChunkTooLarge,
					fmt::format("chunk ({},{}) needs {} sectors for {} bytes, the maximum is {}", x, z, needed, len, MaxSectorsPerChunk));
		}

		std::lock_guard<std::mutex> lck(mtx_);
		checkOpen();

		int idx = chunkIndex(x, z);
		Location old = tables_.location(idx);
		bool oldIsValid = not old.empty() and not unmapped_.test(idx);

		if (oldIsValid and old.sectorCount == needed) {
			// Same footprint: overwrite in place. Map and offset table stay as they are.
			if (opts_.verbose) fmt::print(" - REGION SAVE {} [{},{}] {}B = rewrite {}\n", path_, x, z, len, old.sectorNumber);
			writeSectors(old.sectorNumber, data, len);
		} else {
			releaseRun(idx);

			Location loc;
			loc.sectorCount = static_cast<uint32_t>(needed);

			auto start = sectors_.findFirstFit(needed);
			if (start.has_value()) {
				loc.sectorNumber = static_cast<uint32_t>(start.value());
				if (opts_.verbose) fmt::print(" - REGION SAVE {} [{},{}] {}B = reuse {}\n", path_, x, z, len, loc.sectorNumber);
				sectors_.mark(loc.sectorNumber, needed, false);
				writeSectors(loc.sectorNumber, data, len);
			} else {
				// No hole is big enough: append zeroed sectors.
				loc.sectorNumber = static_cast<uint32_t>(sectors_.size());
				if (opts_.verbose) fmt::print(" - REGION SAVE {} [{},{}] {}B = grow {}\n", path_, x, z, len, loc.sectorNumber);
				env_.writeZeros(static_cast<uint64_t>(loc.sectorNumber) * SectorBytes, needed * SectorBytes);
				sectors_.grow(needed, false);
				sizeDelta_ += static_cast<int64_t>(SectorBytes * needed);
				writeSectors(loc.sectorNumber, data, len);
			}

			tables_.setLocation(idx, loc);
			unmapped_.reset(idx);
		}

		tables_.setTimestamp(idx, now());
	}

	ChunkBuffer RegionFile::getChunkWriter(int x, int z) {
		checkWritable(x, z);
		{
			std::lock_guard<std::mutex> lck(mtx_);
			checkOpen();
		}
		return ChunkBuffer(*this, x, z, opts_.compressionLevel);
	}

	void RegionFile::remove(int x, int z) {
		checkWritable(x, z);

		std::lock_guard<std::mutex> lck(mtx_);
		checkOpen();

		int idx = chunkIndex(x, z);
		Location old = tables_.location(idx);
		if (opts_.verbose) fmt::print(" - REGION DELETE {} [{},{}] sectors {}+{}\n", path_, x, z, old.sectorNumber, old.sectorCount);

		releaseRun(idx);
		tables_.setLocation(idx, Location{});
		unmapped_.reset(idx);
		tables_.setTimestamp(idx, now());
	}

	int64_t RegionFile::sizeDelta() {
		std::lock_guard<std::mutex> lck(mtx_);
		checkOpen();
		int64_t ret = sizeDelta_;
		sizeDelta_ = 0;
		return ret;
	}

	int RegionFile::chunkCount() {
		std::lock_guard<std::mutex> lck(mtx_);
		checkOpen();
		return tables_.usedCount();
	}

	Location RegionFile::location(int x, int z) {
		if (outOfBounds(x, z))
			throw RegionError(ErrorKind::OutOfBounds, fmt::format("chunk ({},{}) is outside the 32x32 grid", x, z));
		std::lock_guard<std::mutex> lck(mtx_);
		checkOpen();
		return tables_.location(chunkIndex(x, z));
	}

	uint32_t RegionFile::timestamp(int x, int z) {
		if (outOfBounds(x, z))
			throw RegionError(ErrorKind::OutOfBounds, fmt::format("chunk ({},{}) is outside the 32x32 grid", x, z));
		std::lock_guard<std::mutex> lck(mtx_);
		checkOpen();
		return tables_.timestamp(chunkIndex(x, z));
	}

	size_t RegionFile::sectorCount() {
		std::lock_guard<std::mutex> lck(mtx_);
		checkOpen();
		return sectors_.size();
	}

	SectorMap RegionFile::sectorMap() {
		std::lock_guard<std::mutex> lck(mtx_);
		checkOpen();
		return sectors_;
	}

	void RegionFile::close() {
		std::lock_guard<std::mutex> lck(mtx_);
		if (closed_) return;
		closed_ = true;
		if (opts_.verbose) fmt::print(" - REGION CLOSE {}\n", path_);
		env_.close();
	}

}

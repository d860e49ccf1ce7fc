#pragma once

#include "mcregion/coordinates.h"
#include "mcregion/detail/env.h"
#include "mcregion/detail/sector_map.h"
#include "mcregion/region/header_tables.h"
#include "mcregion/region/codec.h"
#include "mcregion/region/chunk_buffer.h"

#include <bitset>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcregion {

	struct RegionOptions {
		bool readonly = false;
		// fsync() on close().
		bool syncOnClose = true;
		// zlib level used by getChunkWriter(). -1 is zlib's default.
		int compressionLevel = DefaultCompressionLevel;
		// Trace every read/save/delete.
		bool verbose = false;

		static RegionOptions getReadonly() {
			RegionOptions o;
			o.readonly = true;
			return o;
		}
	};

	//
	// One region file: a 32x32 grid of compressed chunks packed into 4096-byte sectors.
	//
	// The file is:
	//       [0] offset table    (1024 x u32 BE, (sector << 8) | count, 0 = absent)
	//       [1] timestamp table (1024 x u32 BE, epoch seconds)
	//       [2..] sectors. A chunk run starts with u32 BE length L, a version byte and L-1 payload bytes.
	//
	// All operations that touch the tables, the sector map or the file take one mutex,
	// so writes and deletes on one RegionFile are linearized. Nothing is synchronized
	// across different RegionFile objects, or across processes.
	//
	// Chunk content is compressed before it reaches the lock: either by the caller, who
	// passes already-encoded bytes to write(), or incrementally inside a ChunkBuffer.
	//
	class RegionFile {
		public:

			// Throws RegionError(NotFound) if @opts.readonly and the file does not exist,
			// RegionError(BadRegionName) if the name has no region coordinates.
			RegionFile(const std::string& path, const RegionOptions& opts = {});
			~RegionFile();

			RegionFile(const RegionFile&) = delete;
			RegionFile& operator=(const RegionFile&) = delete;

			inline int32_t regionX() const { return coord_.x; }
			inline int32_t regionZ() const { return coord_.z; }
			inline RegionCoordinate coordinate() const { return coord_; }
			inline const std::string& path() const { return path_; }
			inline bool isReadOnly() const { return opts_.readonly; }
			// The file's mtime when it was opened, ms since epoch. 0 for a new file.
			inline int64_t lastModified() const { return lastModified_; }

			// Decompressed content of a chunk, or nullopt if the cell is empty or out of bounds.
			// Throws RegionError InvalidSector / InvalidLength / UnsupportedCodecVersion for damaged cells.
			std::optional<ChunkStream> read(int x, int z);
			std::optional<std::vector<uint8_t>> readAll(int x, int z);

			bool contains(int x, int z);

			// Stores @len bytes that were already encoded with the default codec version.
			void write(int x, int z, const void* data, size_t len);
			inline void write(int x, int z, const EncodedChunk& chunk) { write(x, z, chunk.bytes.data(), chunk.bytes.size()); }

			// Returns a buffer that compresses what is written to it and stores it at (x,z)
			// when it is committed or goes out of scope.
			ChunkBuffer getChunkWriter(int x, int z);

			void remove(int x, int z);

			// Bytes the file has grown by since the last call.
			int64_t sizeDelta();

			int chunkCount();

			Location location(int x, int z);
			uint32_t timestamp(int x, int z);
			size_t sectorCount();

			// Copy of the free map. Only meant for inspection and tests.
			SectorMap sectorMap();

			void close();
			inline bool isOpen() const { return not closed_; }

			// Sectors needed to store @encodedLen bytes plus the chunk header.
			static inline size_t sectorsNeeded(size_t encodedLen) {
				return (encodedLen + ChunkHeaderBytes + SectorBytes - 1) / SectorBytes;
			}

		private:

			void checkOpen() const;
			void checkWritable(int x, int z) const;

			void writeSectors(uint32_t sectorNumber, const void* data, size_t len);
			// Frees the run of cell @idx, unless it was left out of the map at load.
			void releaseRun(int idx);

			uint32_t now() const;

			std::string path_;
			RegionOptions opts_;
			RegionCoordinate coord_;
			int64_t lastModified_ = 0;

			std::mutex mtx_;
			FileEnvironment env_;
			HeaderTables tables_;
			SectorMap sectors_;
			// Cells whose entry pointed outside the file when it was opened.
			std::bitset<ChunksPerRegion> unmapped_;
			int64_t sizeDelta_ = 0;
			bool closed_ = false;
	};

}

#pragma once

#include "mcregion/coordinates.h"

#include <array>
#include <cstdint>

namespace mcregion {

	class FileEnvironment;

	// One offset-table entry: (sectorNumber << 8) | sectorCount. Zero means absent.
	struct Location {
		uint32_t sectorNumber = 0;
		uint32_t sectorCount  = 0;

		inline bool empty() const { return sectorNumber == 0 and sectorCount == 0; }
		inline uint32_t end() const { return sectorNumber + sectorCount; }

		inline uint32_t pack() const { return (sectorNumber << 8) | (sectorCount & 0xff); }
		static inline Location unpack(uint32_t v) { return Location { v >> 8, v & 0xff }; }

		inline bool operator==(const Location& o) const { return sectorNumber == o.sectorNumber and sectorCount == o.sectorCount; }
		inline bool operator!=(const Location& o) const { return not (*this == o); }
	};

	//
	// The two 4096-byte tables at the start of a region file.
	//
	//       sector 0: 1024 big-endian u32 offsets, indexed by x + 32*z
	//       sector 1: 1024 big-endian u32 timestamps (epoch seconds)
	//
	// Both are mirrored in memory. The setters write through to the file immediately.
	// Indices are not checked here; RegionFile does the bounds checks.
	//
	class HeaderTables {
		public:

			HeaderTables(FileEnvironment& env);

			// Reads both tables. Bytes missing from a short file read as zero.
			void load();

			// Writes both tables as all-zero, in memory and on disk.
			void initialize();

			inline uint32_t rawOffset(int index) const { return offsets_[index]; }
			inline Location location(int index) const { return Location::unpack(offsets_[index]); }
			inline uint32_t timestamp(int index) const { return timestamps_[index]; }

			void setLocation(int index, const Location& loc);
			void setTimestamp(int index, uint32_t value);

			int usedCount() const;

			static constexpr uint64_t offsetTablePosition    = 0;
			static constexpr uint64_t timestampTablePosition = SectorBytes;
			static constexpr uint64_t tablesLength           = SectorBytes * HeaderSectors;

		private:
			FileEnvironment& env_;
			std::array<uint32_t, ChunksPerRegion> offsets_ {};
			std::array<uint32_t, ChunksPerRegion> timestamps_ {};
	};

}

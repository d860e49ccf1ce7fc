#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

namespace mcregion {

	//
	// Tracks which 4096-byte sectors of a region file are in use.
	// A bit-set, one bit per sector, set means occupied.
	//
	// Sectors [0, reserved) hold the header tables. They are occupied from construction
	// and releasing them is a no-op.
	//
	// Allocation is first-fit: scan ascending, keep the length of the current free run,
	// reset it on any occupied sector, and stop at the first run that is long enough.
	// There is no free-list; the map for a 1 GiB file is 32 KiB, and the scan is cheap next
	// to the write that follows it.
	//
	class SectorMap {
		public:

			SectorMap(size_t nsectors=0, size_t reserved=2);

			inline size_t size() const { return nsectors_; }
			inline size_t reserved() const { return reserved_; }

			inline bool occ(size_t sector) const {
				return (bits_[sector / 8] & (1 << (sector % 8))) != 0;
			}
			inline bool isFree(size_t sector) const { return not occ(sector); }

			// Sets [start, start+count) to free or occupied.
			// Throws std::out_of_range if the run is not inside the map.
			void mark(size_t start, size_t count, bool free);

			// First run of @n free sectors, or nullopt if the file must grow.
			std::optional<size_t> findFirstFit(size_t n) const;

			// Appends @n sectors and returns the index of the first one.
			size_t grow(size_t n, bool free);

			size_t occupiedCount() const;
			std::vector<size_t> occupiedSectors() const;

		private:

			inline void setOcc(size_t sector, bool value) {
				if (value) bits_[sector / 8] |=  (1 << (sector % 8));
				else       bits_[sector / 8] &= ~(1 << (sector % 8));
			}

			std::vector<uint8_t> bits_;
			size_t nsectors_ = 0;
			size_t reserved_ = 2;
	};

}

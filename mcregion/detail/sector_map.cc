#include "sector_map.h"

#include <fmt/core.h>
#include <stdexcept>

namespace mcregion {

	SectorMap::SectorMap(size_t nsectors, size_t reserved)
		: bits_((nsectors + 7) / 8, 0), nsectors_(nsectors), reserved_(reserved)
	{
		for (size_t i=0; i<reserved_ and i<nsectors_; i++) setOcc(i, true);
	}

	void SectorMap::mark(size_t start, size_t count, bool free) {
		if (start > nsectors_ or count > nsectors_ - start)
			throw std::out_of_range(fmt::format("SectorMap::mark [{}, {}) outside of {} sectors", start, start+count, nsectors_));

		for (size_t i=start; i<start+count; i++) {
			// The header sectors never become free.
			if (free and i < reserved_) continue;
			setOcc(i, not free);
		}
	}

	std::optional<size_t> SectorMap::findFirstFit(size_t n) const {
		if (n == 0) return {};

		size_t runStart = 0;
		size_t runLength = 0;
		for (size_t i=0; i<nsectors_; i++) {
			if (occ(i)) {
				runLength = 0;
				continue;
			}
			if (runLength == 0) runStart = i;
			runLength++;
			if (runLength >= n) return runStart;
		}

		return {};
	}

	size_t SectorMap::grow(size_t n, bool free) {
		size_t first = nsectors_;
		nsectors_ += n;
		bits_.resize((nsectors_ + 7) / 8, 0);
		// A map that started empty may still be growing over the header sectors.
		for (size_t i=first; i<nsectors_; i++) setOcc(i, i < reserved_ or not free);
		return first;
	}

	size_t SectorMap::occupiedCount() const {
		size_t n = 0;
		for (size_t i=0; i<nsectors_; i++) n += occ(i);
		return n;
	}

	std::vector<size_t> SectorMap::occupiedSectors() const {
		std::vector<size_t> out;
		for (size_t i=0; i<nsectors_; i++)
			if (occ(i)) out.push_back(i);
		return out;
	}

}

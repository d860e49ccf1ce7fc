#include "header_tables.h"
#include "mcregion/detail/env.h"
#include "mcregion/detail/bytes.hpp"

#include <vector>

namespace mcregion {

	HeaderTables::HeaderTables(FileEnvironment& env) : env_(env) {
	}

	void HeaderTables::load() {
		std::vector<uint8_t> buf(tablesLength, 0);
		env_.readAt(0, buf.data(), buf.size());

		for (int i=0; i<ChunksPerRegion; i++) {
			offsets_[i]    = loadBigEndian32(buf.data() + offsetTablePosition    + 4*i);
			timestamps_[i] = loadBigEndian32(buf.data() + timestampTablePosition + 4*i);
		}
	}

	void HeaderTables::initialize() {
		offsets_.fill(0);
		timestamps_.fill(0);
		env_.writeZeros(0, tablesLength);
	}

	void HeaderTables::setLocation(int index, const Location& loc) {
		uint8_t buf[4];
		storeBigEndian32(buf, loc.pack());
		env_.writeAt(offsetTablePosition + 4*index, buf, 4);
		offsets_[index] = loc.pack();
	}

	void HeaderTables::setTimestamp(int index, uint32_t value) {
		uint8_t buf[4];
		storeBigEndian32(buf, value);
		env_.writeAt(timestampTablePosition + 4*index, buf, 4);
		timestamps_[index] = value;
	}

	int HeaderTables::usedCount() const {
		int n = 0;
		for (auto o : offsets_) n += o != 0;
		return n;
	}

}

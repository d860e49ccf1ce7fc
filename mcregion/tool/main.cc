#include <fmt/core.h>
#include <fmt/color.h>

#include "mcregion/region/region_file.h"
#include "mcregion/detail/argparse.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iterator>

using namespace mcregion;

namespace {

	std::vector<uint8_t> readWholeFile(const std::string& path) {
		std::ifstream ifs(path, std::ios::binary);
		if (not ifs) throw BadFileError(path, "open for reading", errno);
		return std::vector<uint8_t>(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
	}

	void writeWholeFile(const std::string& path, const std::vector<uint8_t>& data) {
		std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
		if (not ofs) throw BadFileError(path, "open for writing", errno);
		ofs.write(reinterpret_cast<const char*>(data.data()), data.size());
		if (not ofs) throw BadFileError(path, "write", errno);
	}

	void do_info(RegionFile& region) {
		auto map = region.sectorMap();
		fmt::print(" - Region ({},{}) '{}'{}\n", region.regionX(), region.regionZ(), region.path(), region.isReadOnly() ? " (readonly)" : "");
		fmt::print(" - Last modified {} ms\n", region.lastModified());
		fmt::print(" - Chunks  {:>5d} / {}\n", region.chunkCount(), ChunksPerRegion);
		fmt::print(" - Sectors {:>5d} ({} bytes), {} occupied, {} free\n",
				map.size(), map.size() * SectorBytes,
				map.occupiedCount(), map.size() - map.occupiedCount());
	}

	void do_list(RegionFile& region) {
		int n = 0;
		for (int z=0; z<RegionWidth; z++)
			for (int x=0; x<RegionWidth; x++) {
				if (not region.contains(x,z)) continue;
				Location loc = region.location(x,z);
				fmt::print(" - [{:>2d},{:>2d}] sector {:>6d} count {:>3d} timestamp {}\n", x, z, loc.sectorNumber, loc.sectorCount, region.timestamp(x,z));
				n++;
			}
		fmt::print(" - {} chunks\n", n);
	}

	int do_check(RegionFile& region) {
		int good = 0, bad = 0;
		for (int z=0; z<RegionWidth; z++)
			for (int x=0; x<RegionWidth; x++) {
				if (not region.contains(x,z)) continue;
				try {
					auto data = region.readAll(x,z);
					if (data) good++;
				} catch (const RegionError& e) {
					if (not e.isCorruption() and e.kind() != ErrorKind::UnsupportedCodecVersion) throw;
					fmt::print(fmt::fg(fmt::color::yellow), " - [{:>2d},{:>2d}] {}\n", x, z, e.what());
					bad++;
				}
			}
		auto color = bad ? fmt::color::red : fmt::color::green;
		fmt::print(fmt::fg(color), " - {} chunks ok, {} unreadable\n", good, bad);
		return bad ? 1 : 0;
	}

}

int main(int argc, char** argv) {

	try {
		ArgParser parser(argc, argv);

		auto action = parser.getChoice2("-a", "--action", "info", "list", "cat", "put", "delete", "check");
		if (not action.has_value()) {
			fmt::print(stderr, "usage: {} -a info|list|cat|put|delete|check -i <r.X.Z.mcr> [-x X -z Z] [-f input] [-o output] [--level L] [--verbose]\n", argv[0]);
			return 1;
		}

		std::string path = parser.get2OrDie<std::string>("-i", "--input");

		bool writes = *action == "put" or *action == "delete";
		RegionOptions opts = writes ? RegionOptions{} : RegionOptions::getReadonly();
		opts.verbose = parser.have("--verbose");
		opts.compressionLevel = parser.get2<int>("-l", "--level", DefaultCompressionLevel).value();

		RegionFile region(path, opts);

		if (*action == "info") do_info(region);
		if (*action == "list") do_list(region);
		if (*action == "check") return do_check(region);

		if (*action == "cat" or *action == "put" or *action == "delete") {
			int x = parser.get<int>("-x").value_or(-1);
			int z = parser.get<int>("-z").value_or(-1);
			if (outOfBounds(x,z)) {
				fmt::print(stderr, "action `{}` requires `-x` and `-z` in [0,{})\n", *action, RegionWidth);
				return 1;
			}

			if (*action == "cat") {
				auto data = region.readAll(x,z);
				if (not data) {
					fmt::print(stderr, " - no chunk at [{},{}]\n", x, z);
					return 1;
				}
				auto out = parser.get2<std::string>("-o", "--output");
				if (out.has_value()) {
					writeWholeFile(*out, *data);
					fmt::print(" - wrote {} bytes to '{}'\n", data->size(), *out);
				} else {
					fwrite(data->data(), 1, data->size(), stdout);
				}
			}

			if (*action == "put") {
				std::string in = parser.get2OrDie<std::string>("-f", "--file");
				auto data = readWholeFile(in);
				{
					auto buffer = region.getChunkWriter(x,z);
					buffer.write(data);
					buffer.commit();
				}
				Location loc = region.location(x,z);
				fmt::print(" - stored {} bytes at [{},{}] in sectors {}+{}, file grew by {} bytes\n",
						data.size(), x, z, loc.sectorNumber, loc.sectorCount, region.sizeDelta());
			}

			if (*action == "delete") {
				bool had = region.contains(x,z);
				region.remove(x,z);
				fmt::print(" - deleted [{},{}]{}\n", x, z, had ? "" : " (was already empty)");
			}
		}

		region.close();

	} catch (const RegionError& e) {
		fmt::print(stderr, fmt::fg(fmt::color::red), " - {}\n", e.what());
		return 2;
	} catch (const std::exception& e) {
		fmt::print(stderr, fmt::fg(fmt::color::red), " - error: {}\n", e.what());
		return 2;
	}

	return 0;
}

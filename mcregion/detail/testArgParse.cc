#include <catch2/catch_test_macros.hpp>

#include "argparse.hpp"

#include <stdexcept>

using namespace mcregion;

namespace {

	// ArgParser wants char**, the literals are const.
	struct Argv {
		std::vector<std::string> storage;
		std::vector<char*> ptrs;

		Argv(std::initializer_list<const char*> args) : storage(args.begin(), args.end()) {
			for (auto& s : storage) ptrs.push_back(s.data());
		}
		int argc() { return static_cast<int>(ptrs.size()); }
		char** argv() { return ptrs.data(); }
	};

}


TEST_CASE( "ArgParserValues", "[argparse]" ) {
	Argv args { "regionTool", "-a", "put", "-i", "r.0.-1.mcr", "-x", "-3", "--z=7", "--verbose" };
	ArgParser parser(args.argc(), args.argv());

	REQUIRE(parser.getChoice2("-a", "--action", "info", "put").value() == "put");
	REQUIRE(parser.get2OrDie<std::string>("-i", "--input") == "r.0.-1.mcr");
	REQUIRE(parser.get<int>("-x").value() == -3);
	REQUIRE(parser.get<int>("-z").value() == 7);
	REQUIRE(parser.have("--verbose"));
	REQUIRE(parser.get2<int>("-l", "--level", -1).value() == -1);

	REQUIRE_THROWS_AS(parser.get2OrDie<std::string>("-o", "--output"), std::runtime_error);
	REQUIRE_THROWS_AS(parser.getChoice2("-a", "--action", "info", "list"), std::runtime_error);
}

TEST_CASE( "ArgParserRejectsBadInput", "[argparse]" ) {
	// The tool builds its parser inside its error handler because of these.
	Argv dup { "regionTool", "-i", "a", "-i", "b" };
	REQUIRE_THROWS_AS(ArgParser(dup.argc(), dup.argv()), std::runtime_error);

	Argv notInt { "regionTool", "-x", "seven" };
	ArgParser parser(notInt.argc(), notInt.argv());
	REQUIRE_THROWS_AS(parser.get<int>("-x"), std::runtime_error);
}

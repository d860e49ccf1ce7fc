#pragma once

#include <fmt/core.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <stdexcept>

namespace mcregion {

using Str = std::string;

inline bool is_a_number(const Str& s) {
	if (s.empty()) return false;
	char* end = nullptr;
	std::strtod(s.c_str(), &end);
	return end != nullptr and *end == '\0';
}

// ad-hoc (zero-config) cli argument parser.
//
// Call some variation of get<T>() to get assigned values.
// A key given without values (e.g. "--verbose") is a flag: test it with have().
//
// Note: Keys are not allowed to be numbers, because that would make
// parsing negative chunk coordinates impossible (cannot tell if "-x -1" assigns -1
// to key "x", or if the "-1" is starting a new key)
//

class ArgParser {
	public:

		inline ArgParser(int argc, char** argv) {
			parse(argc, argv);
		}

		inline Str getKeyWithoutDashes(const Str& k) {
			if (k.length() > 2 and k[0] == '-' and k[1] == '-') {
				return k.substr(2);
			}
			else if (k.length() > 1 and k[0] == '-') {
				return k.substr(1);
			} else {
				throw std::runtime_error("invalid key, must start with - or --");
			}
		}

		template <class T>
		inline std::optional<T> get(const Str& k) {

			if (is_a_number(k)) {
				throw std::runtime_error("ArgParser keys are NOT allowed to be numbers.");
			}

			Str kk = getKeyWithoutDashes(k);

			auto it = map.find(kk);
			if (it != map.end()) {
				return scanAs<T>(kk, it->second);
			}
			return {};
		}

		template <class T>
		inline std::optional<T> get(const Str& k, const T& def) {
			auto r = get<T>(k);
			if (r.has_value()) return r;
			return def;
		}

		template <class ...Choices>
		inline std::optional<std::string> getChoice(const Str& k, Choices... choices_) {

			auto vv = get<Str>(k);
			if (not vv.has_value()) return {};
			auto v = vv.value();

			std::vector<std::string> choices { choices_... };
			for (auto& c : choices) {
				if (v == c) return c;
			}

			throw std::runtime_error(fmt::format("invalid choice '{}' for {}", v, k));
		}

		template <class T>
		inline std::optional<T> get2(const Str& k1, const Str& k2) {
			auto a = get<T>(k1);
			if (a.has_value()) return a;
			return get<T>(k2);
		}
		template <class T>
		inline std::optional<T> get2(const Str& k1, const Str& k2, const T &def) {
			auto a = get<T>(k1);
			if (a.has_value()) return a;
			return get<T>(k2, def);
		}
		template <class T>
		inline T get2OrDie(const Str& k1, const Str& k2) {
			auto a = get2<T>(k1, k2);
			if (not a.has_value()) throw std::runtime_error(fmt::format("missing required argument {} / {}", k1, k2));
			return a.value();
		}
		template <class ...Choices>
		inline std::optional<std::string> getChoice2(const Str& k1, const Str& k2, Choices... choices_) {
			auto a = getChoice(k1, choices_...);
			if (a.has_value()) return a;
			return getChoice(k2, choices_...);
		}

		inline bool have(const Str& k1) {
			return map.find(getKeyWithoutDashes(k1)) != map.end();
		}
		inline bool have2(const Str& k1, const Str& k2) {
			return have(k1) or have(k2);
		}


	private:
		std::unordered_map<Str, std::vector<Str>> map;

		inline void parse(int argc, char** argv) {
			for (int i=1; i<argc; i++) {
				Str arg{argv[i]};

				if (arg.empty() or arg[0] != '-' or is_a_number(arg)) continue;

				size_t kstart = 0;
				while (kstart < arg.size() and arg[kstart] == '-') kstart++;
				arg = arg.substr(kstart);

				if (arg.find("=") != std::string::npos) {
					auto f = arg.find("=");
					std::string k = arg.substr(0, f);
					std::string v = arg.substr(f+1);

					if (map.find(k) != map.end()) throw std::runtime_error(fmt::format("duplicate key {}", k));
					map[k] = {v};
				} else {
					std::vector<Str> vals;

					// Properly parse negative numbers.
					while (i+1 < argc and (argv[i+1][0] != '-' or is_a_number(argv[i+1]))) {
						Str val{argv[++i]};
						vals.push_back(val);
					}

					if (map.find(arg) != map.end()) throw std::runtime_error(fmt::format("duplicate key {}", arg));
					map[arg] = vals;
				}
			}
		}

		template <class T>
		inline T scanAs(const Str& k, const std::vector<Str>& ss) {
			if constexpr(std::is_same_v<std::vector<std::string>,T>) {
				return ss;
			} else if constexpr(std::is_same_v<std::vector<int>,T>) {
				std::vector<int> out;
				for (const auto& s : ss) out.push_back(std::stoi(s));
				return out;
			} else {

				// All of these are scalars.
				if (ss.size() != 1) {
					throw std::runtime_error(fmt::format("You asked ArgParser to scan a scalar value for '{}', but the parsed size of the value-set was {}", k, ss.size()));
				}
				const Str& s = ss[0];

				if constexpr(std::is_same_v<bool,T>) {
					return not (s == "0" or s == "off" or s == "no" or s == "n" or s == "N" or s == "" or s == "false" or s == "False");
				} else if constexpr(std::is_integral_v<T>) {
					char* end = nullptr;
					long long i = std::strtoll(s.c_str(), &end, 10);
					if (end == s.c_str() or *end != '\0')
						throw std::runtime_error(fmt::format("'{}' expects an integer, got '{}'", k, s));
					return static_cast<T>(i);
				} else if constexpr(std::is_floating_point_v<T>) {
					if (not is_a_number(s))
						throw std::runtime_error(fmt::format("'{}' expects a number, got '{}'", k, s));
					return static_cast<T>(std::strtod(s.c_str(), nullptr));
				} else {
					static_assert(std::is_same_v<Str,T>, "ArgParser cannot scan this type");
					return s;
				}
			}
		}

};

}

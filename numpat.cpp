/*
	numpat: interactive digit pattern map.

	Commands, one per line:
	add <pattern> <value>      register pattern, fail fast
	atomic <pattern> <value>   register pattern, all variants or none
	get <digits>               look the digits up
	variants <pattern>         list the variants a pattern compiles into
	dump                       print the automaton
	limit <n>                  set the maximum number of variants per pattern
	quit
*/

#include <string>
#include <cstddef>
#include <sstream>
#include <iostream>
#include <string_view>

#include "fmt/core.h"
#include "fmt/format.h"

#include "numpat/format.hpp"
#include "numpat/pattern_map.hpp"
#include "numpat/pattern_compiler.hpp"

namespace {

using std::string;
using std::string_view;

using map_t = numpat::pattern_map<string>;

constexpr string_view usage =
	"usage: add <pattern> <value> | atomic <pattern> <value> | get <digits> | "
	"variants <pattern> | dump | limit <n> | quit\n";

void report(const numpat::error_info<char>& info) {
	fmt::print(stderr, "error: {}\n", info);
}

void do_add(map_t& map, std::istringstream& args, bool atomic) {
	string pattern, value;
	if(!(args >> pattern >> value)) {
		fmt::print(stderr, "{}", usage);
		return;
	}
	auto result = atomic ? map.add_atomic(pattern, value) : map.add(pattern, value);
	if(!result.ok()) {
		report(result);
		return;
	}
	fmt::print("added {} -> {}\n", pattern, value);
}

void do_get(const map_t& map, std::istringstream& args) {
	// an empty argument queries the empty string
	string digits;
	args >> digits;
	auto [errc, value] = map.get(digits);
	if(!errc.ok()) {
		report(errc);
		return;
	}
	if(value == nullptr) fmt::print("\"{}\": no match\n", digits);
	else fmt::print("\"{}\": {}\n", digits, *value);
}

void do_variants(const map_t& map, std::istringstream& args) {
	string pattern;
	args >> pattern;
	auto [errc, sequences] = numpat::compile<char>(pattern, map.max_variants);
	if(!errc.ok()) {
		report(errc);
		return;
	}
	fmt::print("{} variant(s):\n", sequences.size());
	for(const auto& sequence: sequences) {
		fmt::print("  [{}]\n", numpat::to_string(sequence));
	}
}

void do_limit(map_t& map, std::istringstream& args) {
	std::size_t limit = 0;
	if(!(args >> limit)) {
		fmt::print(stderr, "{}", usage);
		return;
	}
	map.max_variants = limit;
	fmt::print("max variants: {}\n", limit);
}

} // namespace

int main(int argc, const char** argv) {
	map_t map;

	string line;
	while(std::getline(std::cin, line)) {
		std::istringstream args{line};
		string command;
		if(!(args >> command)) continue;

		if(command == "add")           do_add(map, args, false);
		else if(command == "atomic")   do_add(map, args, true);
		else if(command == "get")      do_get(map, args);
		else if(command == "variants") do_variants(map, args);
		else if(command == "dump")     fmt::print("{}", map.dump());
		else if(command == "limit")    do_limit(map, args);
		else if(command == "quit")     break;
		else fmt::print(stderr, "{}", usage);
	}

	return 0;
}

#pragma once

/*
	Digit pattern map.

	Registers digit patterns (see pattern_compiler.hpp) with a value each and
	classifies concrete digit strings against all of them at once:
	every variant of every pattern is absorbed into one shared automaton,
	a query walks it digit by digit.

	add("12[3]*4", v);  // get("124"), get("1234"), get("12334") -> v
	add("12[3]+4", v);  // get("1234"), get("12334") -> v, get("124") -> no value
	add("[12][34]", v); // get("13"), get("14"), get("23"), get("24") -> v
*/

#include <tuple>
#include <memory>
#include <string>
#include <cstddef>
#include <utility>
#include <concepts>
#include <string_view>

#include "error.hpp"
#include "format.hpp"
#include "trie_node.hpp"
#include "pattern_compiler.hpp"

namespace numpat {

namespace impl {

using std::move;
using std::exchange;
using std::tuple;
using std::size_t;
using std::unique_ptr;
using std::make_unique;
using std::basic_string_view;

// concepts
using std::copy_constructible;
using std::equality_comparable;

template <typename ValueT, typename CharT>
requires equality_comparable<ValueT> && copy_constructible<ValueT>
struct pattern_map {

	using value_t = ValueT;
	using char_t = CharT;
	using string_view_t = basic_string_view<char_t>;

	using node_t = trie_node<value_t>;
	using compiler_t = pattern_compiler<char_t>;
	using error_info_t = error_info<char_t>;

	size_t max_variants = compiler_t::default_max_variants;

protected:
	unique_ptr<node_t> root = make_unique<node_t>();

	// walk each variant from root, creating the path on the way.
	// not transactional: variants before a failing one stay inserted
	static error_info_t insert_variants(node_t& root, const token_sequences& sequences, const value_t& value) {
		for(size_t i = 0; i < sequences.size(); ++i) {
			node_t* current = &root;
			for(const auto& t: sequences[i]) {
				current = &current->insert_transition(t);
			}

			if(!current->value.has_value()) {
				current->set_value(value);
			}else if(!(*current->value == value)) {
				return {error_category::path_already_exists, i};
			}
		}
		return {};
	}

	tuple<error_info_t, token_sequences> compile(string_view_t pattern) const{
		compiler_t compiler;
		compiler.max_variants = max_variants;
		compiler.parse(pattern);
		return {compiler.get_error(), compiler.generate()};
	}

public:

	pattern_map() = default;

	pattern_map(const pattern_map& other):
		max_variants{other.max_variants}, root{make_unique<node_t>(*other.root)} {}

	pattern_map& operator=(const pattern_map& other) {
		if(this != &other) {
			max_variants = other.max_variants;
			root = make_unique<node_t>(*other.root);
		}
		return *this;
	}

	// the moved-from map is left empty, not rootless
	pattern_map(pattern_map&& other):
		max_variants{other.max_variants}, root{exchange(other.root, make_unique<node_t>())} {}

	pattern_map& operator=(pattern_map&& other) {
		if(this != &other) {
			max_variants = other.max_variants;
			root = exchange(other.root, make_unique<node_t>());
		}
		return *this;
	}

	// fail fast: on path_already_exists the variants registered before the failing one are kept
	error_info_t add(string_view_t pattern, const value_t& value) {
		auto [errc, sequences] = compile(pattern);
		if(!errc.ok()) return errc;
		return insert_variants(*root, sequences, value);
	}

	// all or nothing: variants are staged on a copy of the automaton,
	// which replaces the current one only if every variant was accepted
	error_info_t add_atomic(string_view_t pattern, const value_t& value) {
		auto [errc, sequences] = compile(pattern);
		if(!errc.ok()) return errc;

		auto staged = make_unique<node_t>(*root);
		if(auto result = insert_variants(*staged, sequences, value); !result.ok()) return result;
		root = move(staged);
		return {};
	}

	// returns the value of the pattern the digits match, or nullptr if there's none
	tuple<error_info_t, const value_t*> get(string_view_t digits) const{
		const node_t* current = root.get();
		for(size_t i = 0; i < digits.size(); ++i) {
			auto c = digits[i];
			if(!is_digit(c)) return {error_info_t{error_category::invalid_digit, i, c}, nullptr};

			current = current->get(to_digit(c));
			// failed: can't match
			if(current == nullptr) return {error_info_t{}, nullptr};
		}
		return {error_info_t{}, current->value.has_value() ? &*current->value : nullptr};
	}

	bool empty() const noexcept{
		return root->children.empty() && !root->value.has_value();
	}

	size_t node_count() const noexcept{
		return root->node_count();
	}

	const node_t& get_root() const noexcept{
		return *root;
	}

	std::string dump() const{
		return numpat::dump(*root);
	}

}; // struct pattern_map

} // namespace impl

template <typename ValueT, typename CharT = char>
using pattern_map = impl::pattern_map<ValueT, CharT>;

} // namespace numpat

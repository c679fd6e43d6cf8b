#pragma once

#include <memory>
#include <vector>
#include <cstddef>
#include <utility>
#include <optional>
#include <algorithm>

#include "pattern_compiler.hpp"

namespace numpat {

namespace impl {

using std::move;
using std::vector;
using std::optional;
using std::unique_ptr;
using std::make_unique;

enum class node_category: unsigned char {
	root,       // no transition digit
	exact,      // consumes its digit once
	repeatable  // consumes its digit once, then loops back onto itself
};

constexpr node_category to_node_category(const token& t) noexcept{
	return t.is_repeatable() ? node_category::repeatable : node_category::exact;
}

template <typename ValueT>
struct trie_node {
	// a state of the digit automaton
	// every node exclusively owns its children, the only cycle is the
	// implicit self loop of a repeatable node, which is never stored

	using value_t = ValueT;

	node_category category = node_category::root;
	digit_t digit = 0; // meaningless for root

	vector<unique_ptr<trie_node>> children;
	optional<value_t> value;

	trie_node() noexcept = default;
	trie_node(node_category category, digit_t digit) noexcept: category{category}, digit{digit} {}

	// deep copy
	trie_node(const trie_node& other): category{other.category}, digit{other.digit}, value{other.value} {
		children.reserve(other.children.size());
		for(const auto& child: other.children) {
			children.push_back(make_unique<trie_node>(*child));
		}
	}

	trie_node& operator=(const trie_node& other) {
		if(this != &other) {
			trie_node copy{other};
			*this = move(copy);
		}
		return *this;
	}

	trie_node(trie_node&&) noexcept = default;
	trie_node& operator=(trie_node&&) noexcept = default;

	static trie_node make_root() noexcept{
		return {};
	}

	bool is_root() const noexcept{ return category == node_category::root; }
	bool is_exact() const noexcept{ return category == node_category::exact; }
	bool is_repeatable() const noexcept{ return category == node_category::repeatable; }

	// a repeatable node also handles any digit one of its own children handles,
	// so an already compatible path below it is reused instead of adding a sibling
	bool can_handle(digit_t d) const noexcept{
		switch(category) {
		case node_category::root:       return false;
		case node_category::exact:      return digit == d;
		case node_category::repeatable: return digit == d || can_handle_index(d).has_value();
		}
		return false;
	}

	// the first child able to handle d
	optional<size_t> can_handle_index(digit_t d) const noexcept{
		auto it = std::find_if(children.cbegin(), children.cend(), [d](const auto& child) {
			return child->can_handle(d);
		});
		if(it == children.cend()) return std::nullopt;
		return static_cast<size_t>(it - children.cbegin());
	}

	// exact(d) is upgraded to repeatable(d), never the other way round
	void merge(node_category requested) noexcept{
		if(category == node_category::exact && requested == node_category::repeatable) {
			category = node_category::repeatable;
		}
	}

	// advance into (creating if needed) the node reached by d
	trie_node& insert_transition(digit_t d, node_category requested) {
		if(category == node_category::repeatable && digit == d) return *this; // one more repetition

		if(auto index = can_handle_index(d); index.has_value()) {
			auto& child = *children[*index];
			child.merge(requested);
			return child;
		}

		children.push_back(make_unique<trie_node>(requested, d));
		return *children.back();
	}

	trie_node& insert_transition(const token& t) {
		return insert_transition(t.digit, to_node_category(t));
	}

	// the node reached by d, or nullptr when the walk can't continue
	const trie_node* get(digit_t d) const noexcept{
		if(auto index = can_handle_index(d); index.has_value()) {
			return children[*index].get();
		}
		if(category == node_category::repeatable && digit == d) return this;
		return nullptr;
	}

	const optional<value_t>& get_value() const noexcept{
		return value;
	}

	void set_value(value_t v) {
		value = move(v);
	}

	size_t node_count() const noexcept{
		size_t count = 1;
		for(const auto& child: children) count += child->node_count();
		return count;
	}

}; // struct trie_node

} // namespace impl

using impl::node_category;

template <typename ValueT>
using trie_node = impl::trie_node<ValueT>;

} // namespace numpat

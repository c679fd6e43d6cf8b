#pragma once

// fmt support for the compiled tokens, the automaton and error reports

#include <string>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "fmt/core.h"
#include "fmt/format.h"
#include "fmt/ranges.h"

#include "error.hpp"
#include "trie_node.hpp"
#include "pattern_compiler.hpp"

namespace fmt {

template <>
struct formatter<numpat::token> {
	constexpr auto parse(format_parse_context& ctx) {
		return ctx.begin();
	}

	// 3 or 3+
	template <typename FormatContext>
	auto format(const numpat::token& t, FormatContext& ctx) const {
		return t.is_repeatable() ?
			fmt::format_to(ctx.out(), "{}+", static_cast<unsigned>(t.digit)) :
			fmt::format_to(ctx.out(), "{}", static_cast<unsigned>(t.digit));
	}
};

template <>
struct formatter<numpat::node_category>: formatter<string_view> {
	template <typename FormatContext>
	auto format(numpat::node_category category, FormatContext& ctx) const {
		string_view name = "unknown";
		switch(category) {
		case numpat::node_category::root:       name = "root"; break;
		case numpat::node_category::exact:      name = "exact"; break;
		case numpat::node_category::repeatable: name = "repeatable"; break;
		}
		return formatter<string_view>::format(name, ctx);
	}
};

template <typename CharT>
struct formatter<numpat::error_info<CharT>>: formatter<string_view> {
	template <typename FormatContext>
	auto format(const numpat::error_info<CharT>& info, FormatContext& ctx) const {
		return formatter<string_view>::format(numpat::describe(info), ctx);
	}
};

} // namespace fmt

namespace numpat {

namespace impl {

template <typename ValueT>
void dump_node(fmt::memory_buffer& out, const trie_node<ValueT>& node, std::size_t level) {
	auto it = std::back_inserter(out);
	fmt::format_to(it, "{:{}}", "", level * 2);
	if(node.is_root()) fmt::format_to(it, "{}", node.category);
	else fmt::format_to(it, "{}({})", node.category, static_cast<unsigned>(node.digit));

	if(!node.value.has_value()) {
		fmt::format_to(it, " --> -\n");
	}else if constexpr(fmt::is_formattable<ValueT>::value) {
		fmt::format_to(it, " --> {}\n", *node.value);
	}else {
		fmt::format_to(it, " --> <value>\n");
	}

	for(const auto& child: node.children) {
		dump_node(out, *child, level + 1);
	}
}

} // namespace impl

// "3 4+ 5"
inline std::string to_string(const token_sequence& sequence) {
	return fmt::format("{}", fmt::join(sequence, " "));
}

// one line per node, two spaces of indentation per level
template <typename ValueT>
std::string dump(const trie_node<ValueT>& node) {
	fmt::memory_buffer out;
	impl::dump_node(out, node, 0);
	return fmt::to_string(out);
}

} // namespace numpat

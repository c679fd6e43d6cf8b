#pragma once

/*
	Digit pattern compiler.

	Supported Grammar:
	digit             0-9
	brackets          [d...]
	kleene closure    [d...]*
	positive closure  [d...]+

	Quantifiers are unrolled at compile time: every bracket multiplies the
	set of token sequences built so far, so a pattern compiles into the
	complete list of its concrete variants. A repeated digit becomes a single
	one_or_more token, which the automaton turns into a self-looping state.
*/

#include <tuple>
#include <vector>
#include <cstddef>
#include <utility>
#include <optional>
#include <string_view>

#include "error.hpp"

namespace numpat {

namespace impl {

// functions
using std::move;

// classes / aliases
using std::tuple;
using std::size_t;
using std::vector;
using std::optional;
using std::basic_string_view;

using digit_t = unsigned char;

template <typename CharT>
constexpr bool in_range(CharT a, CharT b, CharT x) noexcept{ return a <= x && x <= b; }

template <typename CharT>
constexpr bool is_digit(CharT c) noexcept{
	return in_range(CharT('0'), CharT('9'), c);
}

// assume is_digit(c)
template <typename CharT>
constexpr digit_t to_digit(CharT c) noexcept{
	return static_cast<digit_t>(c - CharT('0'));
}

enum class repetition: unsigned char {
	exactly_one,
	one_or_more
};

struct token {
	digit_t digit;
	repetition kind;

	static constexpr token make_single(digit_t digit) noexcept{
		return {digit, repetition::exactly_one};
	}

	static constexpr token make_one_or_more(digit_t digit) noexcept{
		return {digit, repetition::one_or_more};
	}

	constexpr bool is_repeatable() const noexcept{
		return kind == repetition::one_or_more;
	}

	friend constexpr bool operator==(const token&, const token&) noexcept = default;
};

using token_sequence = vector<token>;

struct token_sequences {
	// the set of variants a pattern denotes,
	// starts with one empty variant, which is the empty pattern

	vector<token_sequence> variants{token_sequence{}};

	token_sequences() = default;
	token_sequences(vector<token_sequence> variants): variants{move(variants)} {}

	// plain digit, no branching
	void append_token(token t) {
		for(auto& v: variants) v.push_back(t);
	}

	// [d1...dn]: every variant times every alternative
	void extend_tokens(const vector<token>& alternatives) {
		vector<token_sequence> result;
		result.reserve(variants.size() * alternatives.size());
		for(const auto& v: variants) {
			for(const auto& t: alternatives) {
				result.push_back(v);
				result.back().push_back(t);
			}
		}
		variants = move(result);
	}

	// [d1...dn]*: the unextended variants are kept as the zero occurrences branch
	void extend_tokens_for_kleene(const vector<token>& alternatives) {
		vector<token_sequence> result = variants;
		result.reserve(variants.size() * (alternatives.size() + 1));
		for(const auto& v: variants) {
			for(const auto& t: alternatives) {
				result.push_back(v);
				result.back().push_back(token::make_one_or_more(t.digit));
			}
		}
		variants = move(result);
	}

	// [d1...dn]+: exactly one and one or more of each alternative, no zero occurrences branch
	void extend_tokens_for_positive(const vector<token>& alternatives) {
		vector<token_sequence> result;
		result.reserve(variants.size() * alternatives.size() * 2);
		for(const auto& v: variants) {
			for(const auto& t: alternatives) {
				result.push_back(v);
				result.back().push_back(token::make_single(t.digit));
				result.push_back(v);
				result.back().push_back(token::make_one_or_more(t.digit));
			}
		}
		variants = move(result);
	}

	size_t size() const noexcept{ return variants.size(); }
	bool empty() const noexcept{ return variants.empty(); }

	const token_sequence& operator[](size_t i) const{ return variants[i]; }

	auto begin() const noexcept{ return variants.cbegin(); }
	auto end() const noexcept{ return variants.cend(); }

	friend bool operator==(const token_sequences&, const token_sequences&) = default;
};

template <typename CharT>
struct pattern_compiler {
	// a factory of token sequences

	using char_t = CharT;
	using pattern_view_t = basic_string_view<char_t>;
	using pattern_iterator_t = typename pattern_view_t::iterator;
	using error_info_t = error_info<char_t>;

	static constexpr size_t default_max_variants = 65536;
	size_t max_variants = default_max_variants;

	pattern_compiler() = default;

	pattern_compiler(pattern_view_t s) {
		parse(s);
	}

protected:

	token_sequences sequences;
	error_info_t build_result{error_category::success};

	enum class quantifier {
		none,
		kleene,   // *
		positive  // +
	};

	static constexpr quantifier to_quantifier(char_t c) noexcept{
		switch(c) {
		case '*': return quantifier::kleene;
		case '+': return quantifier::positive;
		default:  return quantifier::none;
		}
	}

	static constexpr size_t expansion_factor(quantifier q, size_t alternative_count) noexcept{
		switch(q) {
		case quantifier::kleene:   return alternative_count + 1;
		case quantifier::positive: return alternative_count * 2;
		default:                   return alternative_count;
		}
	}

	tuple<error_category, pattern_iterator_t> fail(pattern_view_t s, error_category category, pattern_iterator_t pos, char_t c = char_t{}) {
		build_result = {category, static_cast<size_t>(pos - s.begin()), c};
		return {category, pos};
	}

	// assume pos is pointing at the first char after the left square bracket '['
	// on failure, pos is left at the offending char, or at end when ']' is missing
	tuple<error_category, vector<token>> parse_brackets(pattern_iterator_t& pos, const pattern_iterator_t& end) {
		vector<token> alternatives;
		while(pos != end && *pos != ']') {
			if(!is_digit(*pos)) return {error_category::invalid_digit, {}};
			alternatives.push_back(token::make_single(to_digit(*pos++)));
		}
		if(pos == end) return {error_category::missing_closing_bracket, {}};
		++pos; // skip ']'
		if(alternatives.empty()) return {error_category::unexpected_empty_range, {}};
		return {error_category::success, move(alternatives)};
	}

public:

	void reset() {
		sequences = token_sequences{};
		build_result = {error_category::success};
	}

	tuple<error_category, pattern_iterator_t> parse(pattern_view_t s) {
		reset();

		auto end = s.end();
		for(auto pos = s.begin(); pos != end;) {
			if(is_digit(*pos)) {
				sequences.append_token(token::make_single(to_digit(*pos)));
				++pos;
				continue;
			}
			if(*pos != '[') return fail(s, error_category::unexpected_char, pos, *pos);

			auto bracket_pos = pos;
			auto [errc, alternatives] = parse_brackets(++pos, end);
			switch(errc) {
			case error_category::success:
				break;
			case error_category::invalid_digit:
				return fail(s, errc, pos, *pos);
			case error_category::unexpected_empty_range:
				return fail(s, errc, bracket_pos);
			default:
				return fail(s, errc, pos);
			}

			auto q = pos != end ? to_quantifier(*pos) : quantifier::none;
			if(q != quantifier::none) ++pos;

			// sequences.size() >= 1 and alternatives.size() >= 1 here
			if(expansion_factor(q, alternatives.size()) > max_variants / sequences.size())
				return fail(s, error_category::expensive_pattern_expansion, bracket_pos);

			switch(q) {
			case quantifier::kleene:   sequences.extend_tokens_for_kleene(alternatives); break;
			case quantifier::positive: sequences.extend_tokens_for_positive(alternatives); break;
			default:                   sequences.extend_tokens(alternatives);
			}
		}

		return {error_category::success, end};
	}

	error_category get_result() const noexcept{
		return build_result.category;
	}

	const error_info_t& get_error() const noexcept{
		return build_result;
	}

	// generate the variants as our result
	token_sequences generate() const{
		if(build_result.category != error_category::success) {
			return token_sequences{vector<token_sequence>{}}; // no variants at all
		}
		return sequences;
	}

}; // struct pattern_compiler

} // namespace impl

using impl::token;
using impl::repetition;
using impl::token_sequence;
using impl::token_sequences;

template <typename CharT>
using pattern_compiler = impl::pattern_compiler<CharT>;

// free functions
template <typename CharT>
std::tuple<error_info<CharT>, token_sequences> compile(std::basic_string_view<CharT> pattern, std::size_t max_variants = pattern_compiler<CharT>::default_max_variants) {
	pattern_compiler<CharT> compiler;
	compiler.max_variants = max_variants;
	compiler.parse(pattern);
	return {compiler.get_error(), compiler.generate()};
}

} // namespace numpat

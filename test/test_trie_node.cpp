#include <memory>
#include <string>
#include <optional>

#include <gtest/gtest.h>

#include "numpat/trie_node.hpp"

using numpat::node_category;

using node_t = numpat::trie_node<std::string>;

TEST(TrieNode, RootCreation) {
	auto root = node_t::make_root();
	EXPECT_TRUE(root.is_root());
	EXPECT_TRUE(root.children.empty());
	EXPECT_FALSE(root.get_value().has_value());
	EXPECT_EQ(root.node_count(), 1u);
}

TEST(TrieNode, RootHandlesNothing) {
	auto root = node_t::make_root();
	root.insert_transition(5, node_category::exact);
	for(unsigned char d = 0; d <= 9; ++d) {
		EXPECT_FALSE(root.can_handle(d)) << int(d);
	}
}

TEST(TrieNode, ExactHandlesItsDigitOnly) {
	node_t node{node_category::exact, 7};
	EXPECT_TRUE(node.can_handle(7));
	EXPECT_FALSE(node.can_handle(6));
	EXPECT_FALSE(node.can_handle(8));
	EXPECT_FALSE(node.can_handle(0));

	// an exact node's children don't extend what it handles
	node.insert_transition(5, node_category::exact);
	EXPECT_FALSE(node.can_handle(5));
}

TEST(TrieNode, RepeatableHandlesWhatItsChildrenHandle) {
	node_t node{node_category::repeatable, 3};
	EXPECT_TRUE(node.can_handle(3));
	EXPECT_FALSE(node.can_handle(5));

	node.insert_transition(5, node_category::exact);
	EXPECT_TRUE(node.can_handle(3));
	EXPECT_TRUE(node.can_handle(5));
	EXPECT_FALSE(node.can_handle(7));
}

TEST(TrieNode, ProbeFollowsRepeatableChainsAndStopsAtExact) {
	node_t through_repeatable{node_category::repeatable, 3};
	through_repeatable
		.insert_transition(4, node_category::repeatable)
		.insert_transition(6, node_category::exact);
	EXPECT_TRUE(through_repeatable.can_handle(4));
	EXPECT_TRUE(through_repeatable.can_handle(6));

	node_t through_exact{node_category::repeatable, 3};
	through_exact
		.insert_transition(4, node_category::exact)
		.insert_transition(6, node_category::exact);
	EXPECT_TRUE(through_exact.can_handle(4));
	EXPECT_FALSE(through_exact.can_handle(6));
}

TEST(TrieNode, InsertCreatesChildOnce) {
	auto root = node_t::make_root();

	auto& child = root.insert_transition(3, node_category::exact);
	EXPECT_TRUE(child.is_exact());
	EXPECT_EQ(child.digit, 3);
	EXPECT_EQ(root.children.size(), 1u);

	EXPECT_EQ(&root.insert_transition(3, node_category::exact), &child);
	EXPECT_EQ(root.children.size(), 1u);

	root.insert_transition(1, node_category::exact);
	root.insert_transition(9, node_category::repeatable);
	ASSERT_EQ(root.children.size(), 3u);
	EXPECT_EQ(root.children[1]->category, node_category::exact);
	EXPECT_EQ(root.children[2]->category, node_category::repeatable);
	EXPECT_EQ(root.children[2]->digit, 9);
}

TEST(TrieNode, RepeatableLoopsOnItsOwnDigit) {
	node_t node{node_category::repeatable, 5};

	auto& same = node.insert_transition(5, node_category::exact);
	EXPECT_EQ(&same, &node);
	EXPECT_TRUE(node.children.empty());
	EXPECT_TRUE(node.is_repeatable());

	auto& child = node.insert_transition(8, node_category::exact);
	EXPECT_NE(&child, &node);
	EXPECT_TRUE(child.is_exact());
	EXPECT_EQ(node.children.size(), 1u);
	EXPECT_EQ(node.digit, 5);
}

TEST(TrieNode, MergeUpgradesExactToRepeatable) {
	auto root = node_t::make_root();
	root.insert_transition(6, node_category::exact);
	ASSERT_EQ(root.children[0]->category, node_category::exact);

	auto& merged = root.insert_transition(6, node_category::repeatable);
	EXPECT_EQ(&merged, root.children[0].get());
	EXPECT_TRUE(merged.is_repeatable());
	EXPECT_EQ(root.children.size(), 1u);
}

TEST(TrieNode, MergeNeverDowngrades) {
	auto root = node_t::make_root();
	root.insert_transition(6, node_category::repeatable);
	root.insert_transition(6, node_category::exact);
	EXPECT_TRUE(root.children[0]->is_repeatable());

	node_t exact{node_category::exact, 3};
	exact.merge(node_category::exact);
	EXPECT_TRUE(exact.is_exact());

	root.merge(node_category::repeatable);
	EXPECT_TRUE(root.is_root());
}

TEST(TrieNode, InsertReusesPathBelowRepeatableSibling) {
	auto root = node_t::make_root();
	auto& repeatable = root.insert_transition(3, node_category::repeatable);
	repeatable.insert_transition(4, node_category::exact);

	// 4 is already handled below repeatable(3), no exact(4) sibling is created
	EXPECT_EQ(&root.insert_transition(4, node_category::exact), &repeatable);
	EXPECT_EQ(root.children.size(), 1u);
	EXPECT_EQ(root.get(4), &repeatable);
}

TEST(TrieNode, Get) {
	auto root = node_t::make_root();
	EXPECT_EQ(root.get(5), nullptr);

	auto& child = root.insert_transition(5, node_category::exact);
	EXPECT_EQ(root.get(5), &child);
	EXPECT_EQ(root.get(3), nullptr);

	// an exact node never returns itself
	EXPECT_EQ(child.get(5), nullptr);
	auto& grandchild = child.insert_transition(7, node_category::exact);
	EXPECT_EQ(child.get(7), &grandchild);
	EXPECT_EQ(child.get(8), nullptr);

	node_t repeatable{node_category::repeatable, 6};
	EXPECT_EQ(repeatable.get(6), &repeatable);
	EXPECT_EQ(repeatable.get(7), nullptr);
}

TEST(TrieNode, GetPrefersChildrenOverSelfLoop) {
	node_t repeatable{node_category::repeatable, 6};
	EXPECT_EQ(&repeatable.insert_transition(6, node_category::exact), &repeatable); // self loop, no child

	repeatable.children.push_back(std::make_unique<node_t>(node_category::exact, 6));
	EXPECT_EQ(repeatable.get(6), repeatable.children[0].get());
}

TEST(TrieNode, CanHandleIndex) {
	auto root = node_t::make_root();
	EXPECT_EQ(root.can_handle_index(5), std::nullopt);

	root.insert_transition(3, node_category::exact);
	root.insert_transition(7, node_category::exact);
	root.insert_transition(1, node_category::exact);

	EXPECT_EQ(root.can_handle_index(3), 0u);
	EXPECT_EQ(root.can_handle_index(7), 1u);
	EXPECT_EQ(root.can_handle_index(1), 2u);
	EXPECT_EQ(root.can_handle_index(9), std::nullopt);
}

TEST(TrieNode, WalkThroughRepeatableState) {
	// 12[3]+4 without the exact branch: root -> 1 -> 2 -> 3+ -> 4
	auto root = node_t::make_root();
	root.insert_transition(1, node_category::exact)
		.insert_transition(2, node_category::exact)
		.insert_transition(3, node_category::repeatable)
		.insert_transition(4, node_category::exact)
		.set_value("final_value");

	auto three = root.get(1)->get(2)->get(3);
	ASSERT_NE(three, nullptr);
	EXPECT_EQ(three->get(3), three);
	EXPECT_EQ(three->get(3)->get(3)->get(4)->get_value(), "final_value");
	EXPECT_EQ(root.node_count(), 5u);
}

TEST(TrieNode, RepeatableWithBypass) {
	// 12[3]*4 inserted by hand
	auto root = node_t::make_root();
	auto& two = root.insert_transition(1, node_category::exact).insert_transition(2, node_category::exact);
	two.insert_transition(4, node_category::exact).set_value("bypassed");
	two.insert_transition(3, node_category::repeatable)
		.insert_transition(4, node_category::exact)
		.set_value("via_repeat");

	auto direct = root.get(1)->get(2)->get(4);
	EXPECT_EQ(direct->get_value(), "bypassed");

	auto via_repeat = root.get(1)->get(2)->get(3)->get(4);
	EXPECT_EQ(via_repeat->get_value(), "via_repeat");

	auto repeat_twice = root.get(1)->get(2)->get(3)->get(3)->get(4);
	EXPECT_EQ(repeat_twice, via_repeat);
}

TEST(TrieNode, TokenOverload) {
	auto root = node_t::make_root();
	auto& repeatable = root.insert_transition(numpat::token::make_one_or_more(2));
	EXPECT_TRUE(repeatable.is_repeatable());
	EXPECT_EQ(&repeatable.insert_transition(numpat::token::make_single(2)), &repeatable);
	EXPECT_TRUE(root.insert_transition(numpat::token::make_single(4)).is_exact());
}

TEST(TrieNode, SetValueOverwrites) {
	auto root = node_t::make_root();
	root.set_value("first");
	EXPECT_EQ(root.get_value(), "first");
	root.set_value("second");
	EXPECT_EQ(root.get_value(), "second");
}

TEST(TrieNode, CopyIsDeep) {
	auto root = node_t::make_root();
	root.insert_transition(1, node_category::exact)
		.insert_transition(2, node_category::repeatable)
		.set_value("original");

	node_t copy{root};
	ASSERT_EQ(copy.node_count(), root.node_count());
	EXPECT_NE(copy.children[0].get(), root.children[0].get());
	EXPECT_TRUE(copy.get(1)->get(2)->is_repeatable());

	copy.insert_transition(1, node_category::exact).insert_transition(2, node_category::exact).set_value("copy");
	copy.insert_transition(9, node_category::exact);
	EXPECT_EQ(root.get(1)->get(2)->get_value(), "original");
	EXPECT_EQ(root.get(9), nullptr);
	EXPECT_EQ(root.node_count(), 3u);

	copy = root;
	EXPECT_EQ(copy.node_count(), 3u);
	EXPECT_EQ(copy.get(1)->get(2)->get_value(), "original");
}

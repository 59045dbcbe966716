#include <gtest/gtest.h>
#include "test_fixtures.hpp"
#include "common/errors.hpp"

using namespace zkverify;

class StatePathTest : public ::testing::Test {
protected:
    fixtures::Ledger ledger{8};
};

TEST_F(StatePathTest, FromTreeVerifies) {
    for (size_t i = 0; i < ledger.commitments.size(); ++i) {
        StatePath path = StatePath::from_tree(ledger.tree, i, ledger.commitments[i]);
        EXPECT_EQ(path.global_state_root, ledger.root());
        EXPECT_EQ(path.leaf_index, i);
        EXPECT_EQ(path.siblings.size(), 3u);
        EXPECT_TRUE(path.verify()) << "leaf " << i;
    }
}

TEST_F(StatePathTest, FromTreeRejectsWrongCommitment) {
    EXPECT_THROW(StatePath::from_tree(ledger.tree, 0, ledger.commitments[1]), std::invalid_argument);
}

TEST_F(StatePathTest, TamperedPathFailsVerification) {
    StatePath path = StatePath::from_tree(ledger.tree, 2, ledger.commitments[2]);

    StatePath wrong_commitment = path;
    wrong_commitment.commitment = BFieldElement(1);
    EXPECT_FALSE(wrong_commitment.verify());

    StatePath wrong_root = path;
    wrong_root.global_state_root = Digest::zero();
    EXPECT_FALSE(wrong_root.verify());

    StatePath wrong_sibling = path;
    wrong_sibling.siblings[1] = Digest::zero();
    EXPECT_FALSE(wrong_sibling.verify());
}

TEST_F(StatePathTest, TextForm) {
    StatePath path = StatePath::from_tree(ledger.tree, 5, ledger.commitments[5]);
    std::string text = path.to_string();
    EXPECT_EQ(text.substr(0, 5), "path1");
    EXPECT_EQ(StatePath::from_string(text), path);

    EXPECT_THROW(StatePath::from_string(state_root_to_string(ledger.root())), ParseError);
    EXPECT_THROW(StatePath::from_string("path1"), ParseError);
}

TEST_F(StatePathTest, StateRootText) {
    std::string text = state_root_to_string(ledger.root());
    EXPECT_EQ(text.substr(0, 3), "sr1");
    EXPECT_EQ(state_root_from_string(text), ledger.root());
    EXPECT_THROW(state_root_from_string("sr1qqqqqqqq"), ParseError);
}

class OfflineQueryTest : public ::testing::Test {
protected:
    fixtures::Ledger ledger{4};

    std::string path_text(size_t i) const {
        return StatePath::from_tree(ledger.tree, i, ledger.commitments[i]).to_string();
    }
};

TEST_F(OfflineQueryTest, NewQueryIsEmpty) {
    OfflineQuery query(state_root_to_string(ledger.root()));
    EXPECT_EQ(query.current_state_root(), ledger.root());
    EXPECT_EQ(query.num_state_paths(), 0u);
    EXPECT_THROW(query.get_state_path_for_commitment(ledger.commitment(0)), NotFoundError);
}

TEST_F(OfflineQueryTest, RejectsMalformedRoot) {
    EXPECT_THROW(OfflineQuery("not a root"), ParseError);
    EXPECT_THROW(OfflineQuery(StatePath::from_tree(ledger.tree, 0, ledger.commitments[0]).to_string()),
                 ParseError);
}

TEST_F(OfflineQueryTest, InsertThenLookup) {
    OfflineQuery query(ledger.root());
    query.add_state_path(ledger.commitment(1), path_text(1));
    EXPECT_EQ(query.num_state_paths(), 1u);

    StatePath path = query.get_state_path_for_commitment(ledger.commitment(1));
    EXPECT_EQ(path.to_string(), path_text(1));
    EXPECT_EQ(query.get_state_path_for_commitment(ledger.commitments[1]), path);
}

TEST_F(OfflineQueryTest, MissingCommitmentMessage) {
    OfflineQuery query(ledger.root());
    try {
        query.get_state_path_for_commitment(fixtures::field(5));
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_STREQ(e.what(), "State path not found for commitment");
    }
}

// Paths are stored as given; checking them is left to verification
TEST_F(OfflineQueryTest, LastInsertWins) {
    OfflineQuery query(ledger.root());
    query.add_state_path(ledger.commitment(0), path_text(0));
    query.add_state_path(ledger.commitment(0), path_text(3));
    EXPECT_EQ(query.num_state_paths(), 1u);
    EXPECT_EQ(query.get_state_path_for_commitment(ledger.commitment(0)).to_string(), path_text(3));
}

TEST_F(OfflineQueryTest, RejectsMalformedInsert) {
    OfflineQuery query(ledger.root());
    EXPECT_THROW(query.add_state_path("12u64", path_text(0)), ParseError);
    EXPECT_THROW(query.add_state_path(ledger.commitment(0), "path1garbage"), ParseError);
    EXPECT_EQ(query.num_state_paths(), 0u);
}

TEST_F(OfflineQueryTest, EmptyJsonForm) {
    OfflineQuery query(ledger.root());
    EXPECT_EQ(query.to_string(),
              "{\"state_paths\":{},\"state_root\":\"" + state_root_to_string(ledger.root()) + "\"}");
}

TEST_F(OfflineQueryTest, JsonIsIndependentOfInsertOrder) {
    OfflineQuery a(ledger.root());
    OfflineQuery b(ledger.root());
    for (size_t i = 0; i < 4; ++i) a.add_state_path(ledger.commitment(i), path_text(i));
    for (size_t i = 4; i-- > 0;) b.add_state_path(ledger.commitment(i), path_text(i));
    EXPECT_EQ(a.to_string(), b.to_string());
    EXPECT_EQ(a, b);
}

TEST_F(OfflineQueryTest, JsonRoundTrip) {
    OfflineQuery restored = OfflineQuery::from_string(ledger.query.to_string());
    EXPECT_EQ(restored, ledger.query);
    EXPECT_EQ(restored.num_state_paths(), 4u);
    EXPECT_EQ(restored.to_string(), ledger.query.to_string());
}

TEST_F(OfflineQueryTest, RejectsMalformedJson) {
    EXPECT_THROW(OfflineQuery::from_string("{"), ParseError);
    EXPECT_THROW(OfflineQuery::from_string("[]"), ParseError);
    EXPECT_THROW(OfflineQuery::from_string("{\"state_paths\":{}}"), ParseError);
    std::string root = state_root_to_string(ledger.root());
    EXPECT_THROW(OfflineQuery::from_string("{\"state_paths\":[],\"state_root\":\"" + root + "\"}"), ParseError);
    EXPECT_THROW(OfflineQuery::from_string("{\"state_paths\":{\"1field\":7},\"state_root\":\"" + root + "\"}"),
                 ParseError);
    EXPECT_THROW(OfflineQuery::from_string("{\"state_paths\":{\"1field\":\"sr1\"},\"state_root\":\"" + root + "\"}"),
                 ParseError);
}

TEST_F(OfflineQueryTest, AsyncLookups) {
    auto root = ledger.query.current_state_root_async();
    EXPECT_EQ(root.get(), ledger.root());

    auto found = ledger.query.get_state_path_for_commitment_async(ledger.commitments[2]);
    EXPECT_TRUE(found.get().verify());

    auto missing = ledger.query.get_state_path_for_commitment_async(BFieldElement(3));
    EXPECT_THROW(missing.get(), NotFoundError);
}

// Concurrent readers share one query
TEST_F(OfflineQueryTest, ConcurrentReaders) {
    std::vector<std::future<StatePath>> lookups;
    for (size_t i = 0; i < 16; ++i) {
        lookups.push_back(std::async(std::launch::async, [this, i]() {
            return ledger.query.get_state_path_for_commitment(ledger.commitments[i % 4]);
        }));
    }
    for (auto& lookup : lookups) {
        EXPECT_TRUE(lookup.get().verify());
    }
}

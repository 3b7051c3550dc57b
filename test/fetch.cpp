#include "mock.hpp"
#include "gtest/gtest.h"

namespace Kelvin::test {

    // give an address n transactions, each from a different counterparty.
    void fund (test_source &source, const derived_address &to, uint32 n, uint32 first_txid = 1) {
        for (uint32 i = 0; i < n; i++)
            source.add (make_tx (first_txid + i, {spend_other (0x10000 + first_txid + i, other_address (i), 2000)}, {pay (to, 1000)}, 100 + i));
    }

    TEST (Fetch, OnePage) {
        test_source source {};
        tx_memo memo {};
        derived_address a = wallet_address (0, 0);
        fund (source, a, 3);

        indexer x {source, memo, quiet ()};
        EXPECT_EQ (x.fetch (a).size (), 3u);
        EXPECT_EQ (source.TransactionCalls, 1u);
    }

    TEST (Fetch, FullPageThenEmpty) {
        test_source source {};
        tx_memo memo {};
        derived_address a = wallet_address (0, 0);
        fund (source, a, sync_options::DefaultPageSize);

        indexer x {source, memo, quiet ()};
        list<indexed_tx> txs = x.fetch (a);
        EXPECT_EQ (txs.size (), sync_options::DefaultPageSize);
        EXPECT_EQ (source.TransactionCalls, 2u);
    }

    TEST (Fetch, ManyPages) {
        test_source source {};
        tx_memo memo {};
        derived_address a = wallet_address (0, 0);
        fund (source, a, 60);

        indexer x {source, memo, quiet ()};
        list<indexed_tx> txs = x.fetch (a);
        EXPECT_EQ (txs.size (), 60u);
        EXPECT_EQ (source.TransactionCalls, 3u);

        // nothing is repeated and the order is kept.
        uint32 n = 1;
        for (const indexed_tx &tx : txs) EXPECT_EQ (tx.TXID, make_txid (n++));
    }

    TEST (Fetch, SmallPages) {
        test_source source {};
        source.PageSize = 5;
        tx_memo memo {};
        derived_address a = wallet_address (0, 0);
        fund (source, a, 12);

        sync_options options = quiet ();
        options.PageSize = 5;
        indexer x {source, memo, options};
        EXPECT_EQ (x.fetch (a).size (), 12u);
        EXPECT_EQ (source.TransactionCalls, 3u);
    }

    TEST (Fetch, CreateUsesMemo) {
        test_source source {};
        tx_memo memo {};
        derived_address a = wallet_address (0, 0);
        fund (source, a, 1);

        test_descriptor d {std::set<keychain> {0}};
        indexer x {source, memo, quiet ()};
        auto first = x.create (d);
        EXPECT_TRUE (first.valid ());
        EXPECT_EQ (source.calls (a), 1u);
        EXPECT_TRUE (bool (memo.get (a)));
        EXPECT_EQ (memo.size (), 1u + sync_options::DefaultBatchSize);

        // the second time we don't need to download anything.
        auto second = x.create (d);
        EXPECT_EQ (source.calls (a), 1u);
        EXPECT_EQ (*first, *second);

        memo.clear ();
        EXPECT_EQ (memo.size (), 0u);
        auto third = x.create (d);
        EXPECT_EQ (source.calls (a), 2u);
        EXPECT_EQ (*first, *third);
    }

    TEST (Fetch, Retry) {
        test_source source {};
        tx_memo memo {};
        derived_address a = wallet_address (0, 0);
        fund (source, a, 1);
        source.Transient[a.Address] = 1;

        auto result = indexer {source, memo, quiet ()}.create (test_descriptor {std::set<keychain> {0}});

        // the first attempt failed but the second succeeded.
        EXPECT_TRUE (result.valid ());
        EXPECT_EQ (source.calls (a), 2u);
        ASSERT_NE (result->address (a.Terminal), nullptr);
        EXPECT_EQ (value (result->address (a.Terminal)->Balance), 1000);
    }

    TEST (Fetch, Failure) {
        test_source source {};
        tx_memo memo {};
        derived_address a0 = wallet_address (0, 0);
        derived_address a1 = wallet_address (0, 1);
        derived_address a2 = wallet_address (0, 2);
        fund (source, a0, 1, 1);
        fund (source, a1, 1, 2);
        fund (source, a2, 1, 3);
        source.Failing.insert (a1.Address);

        sync_options options = quiet ();
        options.BatchSize = 1;
        auto result = indexer {source, memo, options}.create (test_descriptor {std::set<keychain> {0}});

        // every attempt failed and was recorded once.
        EXPECT_FALSE (result.valid ());
        ASSERT_EQ (result.Errors.size (), 1u);
        EXPECT_EQ (result.Errors.first ().Code, error::fetch);
        EXPECT_EQ (source.calls (a1), sync_options::DefaultFetchAttempts);

        // the failed address counts as unused, so with a gap limit of 1 the scan stops there.
        EXPECT_EQ (source.calls (a2), 0u);
        EXPECT_FALSE (bool (memo.get (a1)));

        // what we were able to get is still there.
        ASSERT_NE (result->address (a0.Terminal), nullptr);
        EXPECT_EQ (value (result->address (a0.Terminal)->Balance), 1000);
        EXPECT_EQ (result->address (a1.Terminal), nullptr);
        EXPECT_TRUE (result->consistent ());
    }

    TEST (Fetch, Publish) {
        test_source source {};
        tx_memo memo {};

        Bitcoin::transaction tx {1,
            {Bitcoin::input {Bitcoin::outpoint {make_txid (7), 0}, bytes {}, 0xffffffff}},
            {Bitcoin::output {Bitcoin::satoshi {5000}, wallet_address (0, 0).Script}}, 0};

        broadcast_result result = indexer {source, memo, quiet ()}.publish (tx);
        EXPECT_TRUE (result);
        ASSERT_EQ (source.Broadcast.size (), 1u);
        EXPECT_EQ (source.Broadcast.first (), bytes (tx));
    }

    TEST (Fetch, PublishRejected) {
        test_source source {};
        tx_memo memo {};
        source.Response = broadcast_result {broadcast_result::ERROR_INVALID, "bad-txns-inputs-missingorspent"};

        Bitcoin::transaction tx {1,
            {Bitcoin::input {Bitcoin::outpoint {make_txid (8), 0}, bytes {}, 0xffffffff}},
            {Bitcoin::output {Bitcoin::satoshi {4000}, other_address (0).Script}}, 0};

        sync_options loud {};
        loud.Verbose = true;
        broadcast_result result = indexer {source, memo, loud}.publish (tx);
        EXPECT_FALSE (result);
        EXPECT_EQ (result.Error, broadcast_result::ERROR_INVALID);
        EXPECT_EQ (result.Details, "bad-txns-inputs-missingorspent");

        std::stringstream ss;
        ss << result;
        EXPECT_EQ (ss.str (), "invalid transaction: bad-txns-inputs-missingorspent");
    }

}

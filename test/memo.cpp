#include "scenario.hpp"
#include "gtest/gtest.h"

namespace Kelvin::test {

    TEST (Memo, Replace) {
        tx_memo memo {};
        derived_address a = wallet_address (0, 0);
        indexed_tx tx1 = make_tx (1, {}, {pay (a, 1000)}, 100);
        indexed_tx tx2 = make_tx (2, {}, {pay (a, 2000)});

        EXPECT_FALSE (bool (memo.get (a)));
        EXPECT_TRUE (memo.stats (a).empty ());

        memo.put (a, {tx1});
        memo.put (a, {tx2});

        // a new history replaces the old one.
        ASSERT_TRUE (bool (memo.get (a)));
        EXPECT_EQ (memo.get (a)->size (), 1u);
        EXPECT_EQ (memo.stats (a), (address_stats {static_cast<const std::string &> (a.Address), 0, 1}));

        memo.put (a, {tx1, tx2});
        EXPECT_EQ (memo.stats (a), (address_stats {static_cast<const std::string &> (a.Address), 1, 1}));

        memo.clear ();
        EXPECT_FALSE (bool (memo.get (a)));
        EXPECT_FALSE (memo.poisoned ());
    }

    TEST (Memo, Poisoned) {
        scenario s {};

        EXPECT_THROW (s.Memo.access ([] (tx_memo::histories &) {
            throw exception {} << "failure while the memo was locked";
        }), exception);

        EXPECT_TRUE (s.Memo.poisoned ());
        EXPECT_THROW (s.Memo.get (s.r0), memo_poisoned);
        EXPECT_THROW (s.Memo.put (s.r0, {}), memo_poisoned);
        EXPECT_THROW (s.Memo.clear (), memo_poisoned);

        // a sync can't continue with a poisoned memo.
        EXPECT_THROW (s.sync ().create (s.Descriptor), memo_poisoned);

        wallet_cache cache {};
        EXPECT_THROW (s.sync ().update (s.Descriptor, cache), memo_poisoned);
    }

    TEST (Memo, PoisonedDuringSync) {
        scenario s {};
        wallet_cache cache = *s.sync ().create (s.Descriptor);

        s.Source.StatsFail = true;
        EXPECT_ANY_THROW (s.Memo.access ([] (tx_memo::histories &h) {
            h.clear ();
            throw std::runtime_error {"failure while the memo was locked"};
        }));

        // errors from the indexer are recorded but a poisoned memo is fatal.
        EXPECT_THROW (s.sync ().update (s.Descriptor, cache), memo_poisoned);
    }

}

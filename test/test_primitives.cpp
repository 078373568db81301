// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/types.h"
#include "primitives/outpoint.h"

// ===========================================================================
// OutPoint
// ===========================================================================

TEST_CASE(OutPoint, default_is_null) {
    primitives::OutPoint op;
    CHECK(op.is_null());
    CHECK(op.txid.is_zero());
    CHECK_EQ(op.n, primitives::OutPoint::NULL_INDEX);
}

TEST_CASE(OutPoint, construction) {
    auto txid = core::uint256::from_hex(
        "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b");
    primitives::OutPoint op(txid, 3);
    CHECK(!op.is_null());
    CHECK(op.txid == txid);
    CHECK_EQ(op.n, 3u);
}

TEST_CASE(OutPoint, zero_txid_with_real_index_is_not_null) {
    primitives::OutPoint op(core::uint256{}, 0);
    CHECK(!op.is_null());
}

TEST_CASE(OutPoint, equality) {
    auto txid = core::uint256::from_hex("01");
    primitives::OutPoint a(txid, 1);
    primitives::OutPoint b(txid, 1);
    primitives::OutPoint c(txid, 2);
    primitives::OutPoint d(core::uint256::from_hex("02"), 1);
    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != d);
}

TEST_CASE(OutPoint, to_string) {
    auto txid = core::uint256::from_hex(
        "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b");
    primitives::OutPoint op(txid, 7);
    CHECK_EQ(op.to_string(),
             "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b:7");
}

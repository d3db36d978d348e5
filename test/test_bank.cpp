// flash - MemoryBank tests

#include <catch2/catch.hpp>
#include <flash/bank.hpp>
#include "test_helpers.hpp"

using namespace flash;
using namespace flash::test;

TEST_CASE("MemoryBank transfers", "[bank]") {
    MemoryBank bank;
    bank.mint(USD, ALICE, 100);

    SECTION("Moves value between holders") {
        bank.transfer(USD, ALICE, BOB, 30);
        REQUIRE(bank.balance_of(USD, ALICE) == 70);
        REQUIRE(bank.balance_of(USD, BOB) == 30);
        REQUIRE(bank.balance_of(ETH, BOB) == 0);
    }

    SECTION("Insufficient funds fail without effect") {
        REQUIRE_THROWS_AS(bank.transfer(USD, ALICE, BOB, 101), InsufficientBalance);
        REQUIRE(bank.balance_of(USD, ALICE) == 100);
        REQUIRE(bank.balance_of(USD, BOB) == 0);
    }

    SECTION("Negative amounts are rejected") {
        REQUIRE_THROWS_AS(bank.transfer(USD, ALICE, BOB, -1), InvalidAmount);
        REQUIRE_THROWS_AS(bank.mint(USD, ALICE, -1), InvalidAmount);
    }

    SECTION("Self transfer keeps the balance") {
        bank.transfer(USD, ALICE, ALICE, 100);
        REQUIRE(bank.balance_of(USD, ALICE) == 100);
    }
}

TEST_CASE("MemoryBank journal", "[bank]") {
    MemoryBank bank;
    bank.mint(USD, ALICE, 50);
    REQUIRE(bank.journal_size() == 0);

    SECTION("Revert undoes transfers since the snapshot") {
        uint64_t snap = bank.snapshot();
        bank.transfer(USD, ALICE, BOB, 20);
        bank.mint(ETH, BOB, 5);
        REQUIRE(bank.journal_size() > 0);

        bank.revert(snap);
        REQUIRE(bank.balance_of(USD, ALICE) == 50);
        REQUIRE(bank.balance_of(USD, BOB) == 0);
        REQUIRE(bank.balance_of(ETH, BOB) == 0);
        REQUIRE(bank.journal_size() == 0);
    }

    SECTION("Commit keeps transfers") {
        uint64_t snap = bank.snapshot();
        bank.transfer(USD, ALICE, BOB, 20);
        bank.commit(snap);

        REQUIRE(bank.balance_of(USD, BOB) == 20);
        REQUIRE(bank.journal_size() == 0);
    }

    SECTION("Nested snapshot revert leaves outer changes") {
        uint64_t outer = bank.snapshot();
        bank.transfer(USD, ALICE, BOB, 10);
        uint64_t inner = bank.snapshot();
        bank.transfer(USD, ALICE, CAROL, 10);

        bank.revert(inner);
        REQUIRE(bank.balance_of(USD, CAROL) == 0);
        REQUIRE(bank.balance_of(USD, BOB) == 10);

        bank.revert(outer);
        REQUIRE(bank.balance_of(USD, BOB) == 0);
        REQUIRE(bank.balance_of(USD, ALICE) == 50);
    }

    SECTION("Unknown snapshot") {
        REQUIRE_THROWS_AS(bank.revert(0), std::invalid_argument);
        REQUIRE_THROWS_AS(bank.commit(0), std::invalid_argument);
    }
}

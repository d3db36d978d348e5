// flash - CurrencyLedger tests

#include <catch2/catch.hpp>
#include <flash/currency_ledger.hpp>
#include "test_helpers.hpp"

#include <random>
#include <set>
#include <vector>

using namespace flash;
using namespace flash::test;

TEST_CASE("CurrencyLedger tracks zero crossings", "[ledger]") {
    CurrencyLedger ledger;
    REQUIRE(ledger.delta(ALICE, USD) == 0);
    REQUIRE(ledger.nonzero_count() == 0);

    SECTION("Entering and leaving zero") {
        ledger.apply_delta(ALICE, USD, 5);
        REQUIRE(ledger.nonzero_count() == 1);

        ledger.apply_delta(ALICE, USD, -2);
        REQUIRE(ledger.delta(ALICE, USD) == 3);
        REQUIRE(ledger.nonzero_count() == 1);

        ledger.apply_delta(ALICE, USD, -3);
        REQUIRE(ledger.delta(ALICE, USD) == 0);
        REQUIRE(ledger.nonzero_count() == 0);
        REQUIRE(ledger.stored_entries() == 0);
    }

    SECTION("Sign flip without passing through zero keeps the count") {
        ledger.apply_delta(ALICE, USD, 4);
        ledger.apply_delta(ALICE, USD, -10);
        REQUIRE(ledger.delta(ALICE, USD) == -6);
        REQUIRE(ledger.nonzero_count() == 1);
    }

    SECTION("Entries are independent per participant and currency") {
        ledger.apply_delta(ALICE, USD, 1);
        ledger.apply_delta(ALICE, ETH, -1);
        ledger.apply_delta(BOB, USD, 7);
        REQUIRE(ledger.nonzero_count() == 3);
        REQUIRE(ledger.delta(BOB, ETH) == 0);

        auto entries = ledger.nonzero_entries();
        REQUIRE(entries.size() == 3);

        ledger.apply_delta(BOB, USD, -7);
        REQUIRE(ledger.nonzero_count() == 2);
        REQUIRE(ledger.nonzero_entries().size() == 2);
    }

    SECTION("Zero amount is a no-op") {
        ledger.apply_delta(ALICE, USD, 0);
        REQUIRE(ledger.nonzero_count() == 0);
        REQUIRE(ledger.nonzero_entries().empty());
    }
}

TEST_CASE("CurrencyLedger overflow leaves state untouched", "[ledger]") {
    const I128 max = static_cast<I128>(~U128(0) >> 1);
    CurrencyLedger ledger;

    ledger.apply_delta(ALICE, USD, max);
    REQUIRE_THROWS_AS(ledger.apply_delta(ALICE, USD, 1), DeltaOverflow);
    REQUIRE(ledger.delta(ALICE, USD) == max);
    REQUIRE(ledger.nonzero_count() == 1);

    ledger.apply_delta(BOB, USD, -max);
    ledger.apply_delta(BOB, USD, -1);
    REQUIRE_THROWS_AS(ledger.apply_delta(BOB, USD, -1), DeltaOverflow);
    REQUIRE(ledger.delta(BOB, USD) == -max - 1);
    REQUIRE(ledger.nonzero_count() == 2);
    REQUIRE(ledger.stored_entries() == 2);
}

TEST_CASE("CurrencyLedger counter matches entries after every mutation", "[ledger][property]") {
    const std::vector<ParticipantId> participants{ALICE, BOB, CAROL};
    const std::vector<Currency> currencies{USD, ETH};

    std::mt19937 rng(20240611);
    std::uniform_int_distribution<size_t> pick_p(0, participants.size() - 1);
    std::uniform_int_distribution<size_t> pick_c(0, currencies.size() - 1);
    std::uniform_int_distribution<int> pick_amount(-3, 3);

    CurrencyLedger ledger;
    for (int step = 0; step < 2000; ++step) {
        ledger.apply_delta(participants[pick_p(rng)], currencies[pick_c(rng)], pick_amount(rng));

        size_t expected = 0;
        for (const auto& p : participants) {
            for (const auto& c : currencies) {
                if (ledger.delta(p, c) != 0) ++expected;
            }
        }
        REQUIRE(ledger.nonzero_count() == expected);
        REQUIRE(ledger.stored_entries() == expected);
    }
}

/** Lease policy tests
 *  @file lease_policy_tests.cpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#include <leaseio/lease_policy.hpp>

#include <boost/test/unit_test.hpp>
#include <limits>

using namespace leaseio;

namespace {

    constexpr uint64_t ALICE = 1001;
    constexpr uint64_t BOB = 1002;
    constexpr uint64_t T0 = 1700000000;

    registry_params make_params(uint64_t price, uint64_t multiplier) {
        registry_params p;
        p.admin = 1;
        p.price_per_year = price;
        p.renewal_multiplier = multiplier;
        return p;
    }

    lease_terms make_lease(uint64_t owner, uint64_t registered_at, uint64_t years, uint64_t paid) {
        lease_terms t;
        t.owner = owner;
        t.registered_at = registered_at;
        t.duration_years = years;
        t.paid_amount = paid;
        return t;
    }
}

BOOST_AUTO_TEST_SUITE(lease_policy_tests)

BOOST_AUTO_TEST_CASE(expiration_uses_365_day_years)
{
    const lease_terms t = make_lease(ALICE, T0, 2, 200);
    BOOST_CHECK_EQUAL(lease_expiration(t), T0 + 2 * 31536000ULL);
    BOOST_CHECK_EQUAL(SECONDSPERYEAR, 365ULL * 86400ULL);
}

BOOST_AUTO_TEST_CASE(expiration_saturates_instead_of_wrapping)
{
    constexpr uint64_t maxtime = std::numeric_limits<uint64_t>::max();

    BOOST_CHECK_EQUAL(lease_expiration(make_lease(ALICE, maxtime - 10, 1, 0)), maxtime);
    BOOST_CHECK_EQUAL(lease_expiration(make_lease(ALICE, 0, maxtime / 2, 0)), maxtime);
}

BOOST_AUTO_TEST_CASE(lease_active_through_final_second)
{
    const lease_terms t = make_lease(ALICE, T0, 1, 100);
    const uint64_t expiration = lease_expiration(t);

    BOOST_CHECK(is_lease_active(t, T0));
    BOOST_CHECK(is_lease_active(t, expiration));
    BOOST_CHECK(!is_lease_active(t, expiration + 1));
}

BOOST_AUTO_TEST_CASE(unowned_record_never_active)
{
    const lease_terms t = make_lease(NOOWNER, T0, 5, 0);
    BOOST_CHECK(!is_lease_active(t, T0));
}

BOOST_AUTO_TEST_CASE(year_bounds)
{
    BOOST_CHECK(!is_valid_lease_years(-1));
    BOOST_CHECK(!is_valid_lease_years(0));
    BOOST_CHECK(is_valid_lease_years(1));
    BOOST_CHECK(is_valid_lease_years(10));
    BOOST_CHECK(!is_valid_lease_years(11));
}

BOOST_AUTO_TEST_CASE(amount_bounds)
{
    BOOST_CHECK(!is_valid_lease_amount(-1));
    BOOST_CHECK(is_valid_lease_amount(0));
    BOOST_CHECK(is_valid_lease_amount(MAXLEASEAMOUNT));
    BOOST_CHECK(!is_valid_lease_amount(MAXLEASEAMOUNT + 1));
    BOOST_CHECK(!is_valid_lease_amount(std::numeric_limits<int64_t>::max()));
}

BOOST_AUTO_TEST_CASE(prices)
{
    const registry_params p = make_params(100, 3);
    uint64_t price = 0;

    BOOST_REQUIRE(registration_price(p, 4, price));
    BOOST_CHECK_EQUAL(price, 400ULL);
    BOOST_REQUIRE(renewal_price(p, 4, price));
    BOOST_CHECK_EQUAL(price, 1200ULL);
}

BOOST_AUTO_TEST_CASE(price_overflow_is_reported)
{
    const registry_params p = make_params(std::numeric_limits<uint64_t>::max() / 2 + 1, 1);
    uint64_t price = 0;

    BOOST_CHECK(!registration_price(p, 2, price));
    BOOST_CHECK(!renewal_price(p, 2, price));
    BOOST_CHECK_EQUAL(check_claim(p, nullptr, 2, std::numeric_limits<uint64_t>::max(), T0),
                      ErrorInsufficientPayment);
}

BOOST_AUTO_TEST_CASE(claim_checks_run_in_order)
{
    registry_params p = make_params(100, 2);
    const lease_terms active = make_lease(ALICE, T0, 1, 100);

    // every precondition fails, the pause gate reports first
    p.paused = true;
    BOOST_CHECK_EQUAL(check_claim(p, &active, 0, 0, T0), ErrorContractPaused);

    p.paused = false;
    BOOST_CHECK_EQUAL(check_claim(p, &active, 0, 0, T0), ErrorDomainStillActive);
    BOOST_CHECK_EQUAL(check_claim(p, nullptr, 0, 0, T0), ErrorInvalidDuration);
    BOOST_CHECK_EQUAL(check_claim(p, nullptr, 11, 5000, T0), ErrorInvalidDuration);
    BOOST_CHECK_EQUAL(check_claim(p, nullptr, 2, 199, T0), ErrorInsufficientPayment);
    BOOST_CHECK_EQUAL(check_claim(p, nullptr, 2, 200, T0), LeaseOk);
}

BOOST_AUTO_TEST_CASE(claim_on_lapsed_lease_allowed)
{
    const registry_params p = make_params(100, 2);
    const lease_terms lapsed = make_lease(ALICE, T0, 1, 100);
    const uint64_t expiration = lease_expiration(lapsed);

    BOOST_CHECK_EQUAL(check_claim(p, &lapsed, 1, 100, expiration), ErrorDomainStillActive);
    BOOST_CHECK_EQUAL(check_claim(p, &lapsed, 1, 100, expiration + 1), LeaseOk);
}

BOOST_AUTO_TEST_CASE(renew_checks_run_in_order)
{
    registry_params p = make_params(100, 2);
    const lease_terms owned = make_lease(ALICE, T0, 1, 100);

    p.paused = true;
    BOOST_CHECK_EQUAL(check_renew(p, nullptr, 0, 0, BOB), ErrorContractPaused);

    p.paused = false;
    BOOST_CHECK_EQUAL(check_renew(p, nullptr, 0, 0, BOB), ErrorInvalidDuration);
    BOOST_CHECK_EQUAL(check_renew(p, nullptr, 1, 200, BOB), ErrorNotOwner);
    BOOST_CHECK_EQUAL(check_renew(p, &owned, 1, 200, BOB), ErrorNotOwner);
    BOOST_CHECK_EQUAL(check_renew(p, &owned, 1, 199, ALICE), ErrorInsufficientPayment);
    BOOST_CHECK_EQUAL(check_renew(p, &owned, 1, 200, ALICE), LeaseOk);
}

BOOST_AUTO_TEST_CASE(admin_check)
{
    const registry_params p = make_params(100, 2);
    BOOST_CHECK_EQUAL(check_admin(p, 1), LeaseOk);
    BOOST_CHECK_EQUAL(check_admin(p, ALICE), ErrorUnauthorized);
}

BOOST_AUTO_TEST_CASE(claim_overwrites_every_field)
{
    lease_terms t = make_lease(ALICE, T0, 9, 9000);
    apply_claim(t, BOB, T0 + 100, 3, 450);

    BOOST_CHECK_EQUAL(t.owner, BOB);
    BOOST_CHECK_EQUAL(t.registered_at, T0 + 100);
    BOOST_CHECK_EQUAL(t.duration_years, 3ULL);
    BOOST_CHECK_EQUAL(t.paid_amount, 450ULL);
}

BOOST_AUTO_TEST_CASE(renew_accumulates)
{
    lease_terms t = make_lease(ALICE, T0, 10, 1000);
    apply_renew(t, 10, 2000);
    apply_renew(t, 10, 2000);

    BOOST_CHECK_EQUAL(t.owner, ALICE);
    BOOST_CHECK_EQUAL(t.registered_at, T0);
    BOOST_CHECK_EQUAL(t.duration_years, 30ULL);
    BOOST_CHECK_EQUAL(t.paid_amount, 5000ULL);
}

BOOST_AUTO_TEST_SUITE_END()

/** Lease response body tests
 *  @file lease_response_tests.cpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#include <leaseio/lease_response.hpp>
#include <leaseio/leasejson.hpp>

#include <boost/test/unit_test.hpp>

using namespace leaseio;

namespace {

    lease_terms alice_lease() {
        lease_terms t;
        t.owner = 1001;
        t.registered_at = 1700000000;
        t.duration_years = 1;
        t.paid_amount = 100;
        return t;
    }
}

BOOST_AUTO_TEST_SUITE(lease_response_tests)

BOOST_AUTO_TEST_CASE(status)
{
    BOOST_CHECK_EQUAL(status_response(1700000000, 200),
                      "{\"status\": \"OK\",\"expiration\":\"2023-11-14T22:13:20\",\"fee_collected\":200}");
}

BOOST_AUTO_TEST_CASE(owner)
{
    BOOST_CHECK_EQUAL(owner_response("alice.lease", ""), "{\"domain\":\"alice.lease\",\"registered\":false}");
    BOOST_CHECK_EQUAL(owner_response("alice.lease", "alice"),
                      "{\"domain\":\"alice.lease\",\"registered\":true,\"owner\":\"alice\"}");
}

BOOST_AUTO_TEST_CASE(info)
{
    const lease_terms t = alice_lease();

    BOOST_CHECK_EQUAL(info_response("x", nullptr, "", 0), "{\"domain\":\"x\",\"registered\":false}");
    BOOST_CHECK_EQUAL(info_response("alice.lease", &t, "alice", 1700000000),
                      "{\"domain\":\"alice.lease\",\"registered\":true,\"owner\":\"alice\","
                      "\"registered_at\":\"2023-11-14T22:13:20\",\"duration_years\":1,\"paid_amount\":100,"
                      "\"expiration\":\"2024-11-13T22:13:20\",\"expired\":false}");

    const std::string lapsed = info_response("alice.lease", &t, "alice", lease_expiration(t) + 1);
    BOOST_CHECK(lapsed.find("\"expired\":true") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(availability)
{
    const lease_terms t = alice_lease();

    BOOST_CHECK_EQUAL(availability_response(nullptr, 0), "{\"is_registered\":0,\"is_active\":0}");
    BOOST_CHECK_EQUAL(availability_response(&t, 1700000000),
                      "{\"is_registered\":1,\"is_active\":1,\"expiration\":\"2024-11-13T22:13:20\"}");
    BOOST_CHECK_EQUAL(availability_response(&t, lease_expiration(t) + 1),
                      "{\"is_registered\":1,\"is_active\":0,\"expiration\":\"2024-11-13T22:13:20\"}");
}

BOOST_AUTO_TEST_CASE(config)
{
    registry_params p;
    p.price_per_year = 100;
    p.renewal_multiplier = 2;
    p.paused = true;
    BOOST_CHECK_EQUAL(config_response(p, "admin"),
                      "{\"admin\":\"admin\",\"price_per_year\":100,\"renewal_multiplier\":2,\"paused\":true}");
}

BOOST_AUTO_TEST_CASE(json_escaping)
{
    BOOST_CHECK_EQUAL(json_escape("plain.lease"), "plain.lease");
    BOOST_CHECK_EQUAL(json_escape("a\"b"), "a\\\"b");
    BOOST_CHECK_EQUAL(json_escape("back\\slash"), "back\\\\slash");
    BOOST_CHECK_EQUAL(json_escape("tab\tnew\nline"), "tab\\tnew\\nline");
    BOOST_CHECK_EQUAL(json_escape(std::string("\x01\x1f", 2)), "\\u0001\\u001f");
}

BOOST_AUTO_TEST_CASE(quoted_names_cannot_forge_fields)
{
    const std::string forged = "a\",\"registered\":false,\"x\":\"";
    const lease_terms t = alice_lease();

    BOOST_CHECK_EQUAL(owner_response(forged, "alice"),
                      "{\"domain\":\"a\\\",\\\"registered\\\":false,\\\"x\\\":\\\"\",\"registered\":true,"
                      "\"owner\":\"alice\"}");
    BOOST_CHECK_EQUAL(info_response("q\"", nullptr, "", 0), "{\"domain\":\"q\\\"\",\"registered\":false}");
    BOOST_CHECK(info_response("q\"", &t, "alice", 1700000000).find("{\"domain\":\"q\\\"\",") == 0);
}

BOOST_AUTO_TEST_SUITE_END()

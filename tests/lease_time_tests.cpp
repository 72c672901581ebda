/** Lease time formatting tests
 *  @file lease_time_tests.cpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#include <leaseio/leasetime.hpp>

#include <boost/test/unit_test.hpp>
#include <limits>

using namespace leaseio;

BOOST_AUTO_TEST_SUITE(lease_time_tests)

BOOST_AUTO_TEST_CASE(epoch)
{
    const lease_tm tm = convertleasetime(0);
    BOOST_CHECK_EQUAL(tm.year, 1970);
    BOOST_CHECK_EQUAL(tm.month, 1U);
    BOOST_CHECK_EQUAL(tm.day, 1U);
    BOOST_CHECK_EQUAL(formatleasetime(0), "1970-01-01T00:00:00");
}

BOOST_AUTO_TEST_CASE(known_dates)
{
    BOOST_CHECK_EQUAL(formatleasetime(946684800), "2000-01-01T00:00:00");
    BOOST_CHECK_EQUAL(formatleasetime(951782400), "2000-02-29T00:00:00");
    BOOST_CHECK_EQUAL(formatleasetime(1234567890), "2009-02-13T23:31:30");
    BOOST_CHECK_EQUAL(formatleasetime(1663072000), "2022-09-13T12:26:40");
    BOOST_CHECK_EQUAL(formatleasetime(1700000000), "2023-11-14T22:13:20");
    BOOST_CHECK_EQUAL(formatleasetime(4102444800), "2100-01-01T00:00:00");
}

BOOST_AUTO_TEST_CASE(saturated_expiration_still_formats)
{
    BOOST_CHECK_EQUAL(formatleasetime(std::numeric_limits<uint64_t>::max()), "584554051223-11-09T07:00:15");
}

BOOST_AUTO_TEST_SUITE_END()

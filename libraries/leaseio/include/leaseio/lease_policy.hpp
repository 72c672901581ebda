/** LeasePolicy definitions file
 *  Description: Lease arithmetic and the ordered eligibility checks of the lease registry. Shared by the
 *               lease.domain contract and native tooling, it never touches chain state.
 *  @file lease_policy.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 *
 *  Changes:
 */

#pragma once

#include <cstdint>
#include <limits>
#include "leaseerror.hpp"

namespace leaseio {

    constexpr uint64_t SECONDSPERYEAR = 31536000;   // 365 days, no leap year adjustment
    constexpr int64_t MINLEASEYEARS = 1;
    constexpr int64_t MAXLEASEYEARS = 10;
    constexpr int64_t MAXLEASEAMOUNT = (1LL << 62) - 1;  // largest amount a ledger asset can carry
    constexpr uint64_t NOOWNER = 0;                 // the empty account name, unclaimed
    constexpr uint64_t LeaseOk = 0;

    struct lease_terms {
        uint64_t owner = NOOWNER;
        uint64_t registered_at = 0;
        uint64_t duration_years = 0;
        uint64_t paid_amount = 0;
    };

    struct registry_params {
        uint64_t admin = NOOWNER;
        uint64_t price_per_year = 0;
        uint64_t renewal_multiplier = 0;
        bool paused = false;
    };

    inline bool checked_multiply(const uint64_t a, const uint64_t b, uint64_t &result) {
        if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
            return false;
        }
        result = a * b;
        return true;
    }

    /***
     * This method returns the time at which the lease window closes, computed from the registration
     * anchor and the cumulative duration. Renewals never move the anchor.
     * @param terms the lease being inspected
     * @return registered_at + duration_years * SECONDSPERYEAR, saturated at the maximum uint64_t value
     */
    inline uint64_t lease_expiration(const lease_terms &terms) {
        constexpr uint64_t maxtime = std::numeric_limits<uint64_t>::max();
        uint64_t span = 0;
        if (!checked_multiply(terms.duration_years, SECONDSPERYEAR, span)) {
            return maxtime;
        }
        if (terms.registered_at > maxtime - span) {
            return maxtime;
        }
        return terms.registered_at + span;
    }

    // a lease stays active through the final second of its window
    inline bool is_lease_active(const lease_terms &terms, const uint64_t present_time) {
        return terms.owner != NOOWNER && present_time <= lease_expiration(terms);
    }

    inline bool is_valid_lease_years(const int64_t years) {
        return years >= MINLEASEYEARS && years <= MAXLEASEYEARS;
    }

    inline bool is_valid_lease_amount(const int64_t amount) {
        return amount >= 0 && amount <= MAXLEASEAMOUNT;
    }

    /***
     * Computes price_per_year * years. years must already be validated.
     * @return false when the required amount does not fit in 64 bits, no payment can meet it.
     */
    inline bool registration_price(const registry_params &params, const int64_t years, uint64_t &price) {
        return checked_multiply(params.price_per_year, static_cast<uint64_t>(years), price);
    }

    /***
     * Computes price_per_year * years * renewal_multiplier. years must already be validated.
     * @return false when the required amount does not fit in 64 bits.
     */
    inline bool renewal_price(const registry_params &params, const int64_t years, uint64_t &price) {
        uint64_t base = 0;
        return checked_multiply(params.price_per_year, static_cast<uint64_t>(years), base) &&
               checked_multiply(base, params.renewal_multiplier, price);
    }

    inline uint64_t check_not_paused(const registry_params &params) {
        return params.paused ? ErrorContractPaused : LeaseOk;
    }

    inline uint64_t check_admin(const registry_params &params, const uint64_t caller) {
        return caller == params.admin ? LeaseOk : ErrorUnauthorized;
    }

    /***
     * Evaluates a claim in the order the registry reports failures: pause gate, then the existing lease
     * must be absent or expired, then the duration, then the payment.
     * @param params the registry configuration
     * @param existing the stored lease for the name, nullptr when the name was never registered
     * @param years the requested lease years
     * @param payment the value attached to the claim
     * @param present_time the current time
     * @return LeaseOk or the error code of the first failing precondition
     */
    inline uint64_t check_claim(const registry_params &params, const lease_terms *existing, const int64_t years,
                                const uint64_t payment, const uint64_t present_time) {
        const uint64_t gate = check_not_paused(params);
        if (gate != LeaseOk) {
            return gate;
        }
        if (existing != nullptr && is_lease_active(*existing, present_time)) {
            return ErrorDomainStillActive;
        }
        if (!is_valid_lease_years(years)) {
            return ErrorInvalidDuration;
        }
        uint64_t price = 0;
        if (!registration_price(params, years, price) || payment < price) {
            return ErrorInsufficientPayment;
        }
        return LeaseOk;
    }

    /***
     * Evaluates a renewal: pause gate, duration, ownership, payment. Expiry is deliberately not checked,
     * a lapsed lease can be renewed by its owner until someone else claims it.
     * @param existing the stored lease for the name, nullptr when the name was never registered
     * @param caller the account requesting the renewal
     * @return LeaseOk or the error code of the first failing precondition
     */
    inline uint64_t check_renew(const registry_params &params, const lease_terms *existing, const int64_t years,
                                const uint64_t payment, const uint64_t caller) {
        const uint64_t gate = check_not_paused(params);
        if (gate != LeaseOk) {
            return gate;
        }
        if (!is_valid_lease_years(years)) {
            return ErrorInvalidDuration;
        }
        if (existing == nullptr || existing->owner != caller) {
            return ErrorNotOwner;
        }
        uint64_t price = 0;
        if (!renewal_price(params, years, price) || payment < price) {
            return ErrorInsufficientPayment;
        }
        return LeaseOk;
    }

    // the whole payment is captured, excess is not refunded
    inline void apply_claim(lease_terms &terms, const uint64_t caller, const uint64_t present_time,
                            const int64_t years, const uint64_t payment) {
        terms.owner = caller;
        terms.registered_at = present_time;
        terms.duration_years = static_cast<uint64_t>(years);
        terms.paid_amount = payment;
    }

    inline void apply_renew(lease_terms &terms, const int64_t years, const uint64_t payment) {
        terms.duration_years += static_cast<uint64_t>(years);
        terms.paid_amount += payment;
    }

} // namespace leaseio

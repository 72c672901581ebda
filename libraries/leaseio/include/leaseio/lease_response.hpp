/** LeaseResponse definitions file
 *  Description: Builds the json bodies returned through send_response by the lease registry actions.
 *  @file lease_response.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 *
 *  Changes:
 */

#pragma once

#include <string>
#include "lease_policy.hpp"
#include "leasetime.hpp"
#include "leasejson.hpp"

namespace leaseio {

    using std::string;
    using std::to_string;

    inline string status_response(const uint64_t expiration, const uint64_t fee_collected) {
        return string("{\"status\": \"OK\",\"expiration\":\"") +
               formatleasetime(expiration) + string("\",\"fee_collected\":") +
               to_string(fee_collected) + string("}");
    }

    // owner is empty for names that were never registered
    inline string owner_response(const string &domain, const string &owner) {
        if (owner.empty()) {
            return string("{\"domain\":\"") + json_escape(domain) + string("\",\"registered\":false}");
        }
        return string("{\"domain\":\"") + json_escape(domain) + string("\",\"registered\":true,\"owner\":\"") +
               json_escape(owner) + string("\"}");
    }

    /***
     * Lease details as reported by getinfo.
     * @param terms the stored lease, nullptr when the name was never registered
     * @param owner the owner account rendered as a string
     */
    inline string info_response(const string &domain, const lease_terms *terms, const string &owner,
                                const uint64_t present_time) {
        if (terms == nullptr) {
            return string("{\"domain\":\"") + json_escape(domain) + string("\",\"registered\":false}");
        }
        const uint64_t expiration = lease_expiration(*terms);
        return string("{\"domain\":\"") + json_escape(domain) +
               string("\",\"registered\":true,\"owner\":\"") + json_escape(owner) +
               string("\",\"registered_at\":\"") + formatleasetime(terms->registered_at) +
               string("\",\"duration_years\":") + to_string(terms->duration_years) +
               string(",\"paid_amount\":") + to_string(terms->paid_amount) +
               string(",\"expiration\":\"") + formatleasetime(expiration) +
               string("\",\"expired\":") + (is_lease_active(*terms, present_time) ? "false" : "true") +
               string("}");
    }

    inline string availability_response(const lease_terms *terms, const uint64_t present_time) {
        const bool registered = terms != nullptr && terms->owner != NOOWNER;
        const bool active = registered && is_lease_active(*terms, present_time);
        string response = string("{\"is_registered\":") + (registered ? "1" : "0") +
                          string(",\"is_active\":") + (active ? "1" : "0");
        if (registered) {
            response += string(",\"expiration\":\"") + formatleasetime(lease_expiration(*terms)) + string("\"");
        }
        return response + string("}");
    }

    inline string config_response(const registry_params &params, const string &admin) {
        return string("{\"admin\":\"") + json_escape(admin) +
               string("\",\"price_per_year\":") + to_string(params.price_per_year) +
               string(",\"renewal_multiplier\":") + to_string(params.renewal_multiplier) +
               string(",\"paused\":") + (params.paused ? "true" : "false") + string("}");
    }

    inline string withdraw_response(const uint64_t withdrawn) {
        return string("{\"status\": \"OK\",\"withdrawn\":") + to_string(withdrawn) + string("}");
    }

    inline string deposit_response(const uint64_t deposited) {
        return string("{\"status\": \"OK\",\"deposited\":") + to_string(deposited) + string("}");
    }
}

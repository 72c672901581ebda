/** LeaseRegistry header file
 *  Description: LeaseRegistry smart contract leases human readable domain names for a paid number of years.
 *  @file lease.domain.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/singleton.hpp>
#include <eosiolib/asset.hpp>
#include <leaseio/lease_policy.hpp>
#include <leaseio/lease_store.hpp>
#include <string>

using std::string;

namespace leaseio {

    using namespace eosio;

    // one row per domain name ever registered, rows are overwritten by a reclaiming claim and never erased
    struct [[eosio::table]] lease {

        uint64_t id = 0;
        string domain;
        uint128_t domainhash = 0;
        uint64_t owner_account = 0;
        uint64_t registered_at = 0;
        uint64_t duration_years = 0;
        uint64_t paid_amount = 0;

        // primary_key is required to store structure in multi_index table
        uint64_t primary_key() const { return id; }
        uint128_t by_name() const { return domainhash; }
        uint64_t by_owner() const { return owner_account; }

        EOSLIB_SERIALIZE(lease, (id)(domain)(domainhash)(owner_account)(registered_at)(duration_years)(paid_amount)
        )
    };

    typedef multi_index<"leases"_n, lease,
            indexed_by<"byname"_n, const_mem_fun < lease, uint128_t, &lease::by_name>>,
    indexed_by<"byowner"_n, const_mem_fun<lease, uint64_t, &lease::by_owner>>
    >
    leases_table;

    struct [[eosio::table]] regconfig {
        name admin;
        uint64_t price_per_year = 0;
        uint64_t renewal_multiplier = 0;
        bool paused = false;

        registry_params params() const {
            registry_params p;
            p.admin = admin.value;
            p.price_per_year = price_per_year;
            p.renewal_multiplier = renewal_multiplier;
            p.paused = paused;
            return p;
        }

        static regconfig from_params(const registry_params &p) {
            regconfig cfg;
            cfg.admin = name(p.admin);
            cfg.price_per_year = p.price_per_year;
            cfg.renewal_multiplier = p.renewal_multiplier;
            cfg.paused = p.paused;
            return cfg;
        }

        EOSLIB_SERIALIZE(regconfig, (admin)(price_per_year)(renewal_multiplier)(paused))
    };

    typedef singleton<"regconfig"_n, regconfig> regconfig_singleton;
}

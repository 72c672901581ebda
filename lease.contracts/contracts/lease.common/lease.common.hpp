/** LeaseCommon implementation file
 *  Description: LeaseCommon is the helper directory that assists the lease contracts in common tasks
 *  @file lease.common.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <string>
#include <cstring>
#include <eosiolib/eosio.hpp>
#include <eosiolib/system.hpp>
#include <eosiolib/singleton.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/crypto.hpp>
#include <eosiolib/transaction.hpp>
#include <leaseio/leaseerror.hpp>
#include <leaseio/lease_policy.hpp>
#include <leaseio/lease_response.hpp>
#include "lease.accounts.hpp"

namespace leaseio {

    using namespace eosio;
    using namespace std;

    static uint128_t string_to_uint128_hash(const string &str) {

        eosio::checksum160 tmp;
        uint128_t retval = 0;
        uint8_t *bp = (uint8_t *) &tmp;

        tmp = eosio::sha1(str.c_str(), str.length());

        bp = (uint8_t *) &tmp;
        memcpy(&retval, bp, sizeof(retval));

        return retval;
    }

    /***
     * Moves the value attached to a registry call from the actor into the registry custody.
     * The ledger aborts the whole transaction when the actor cannot cover the payment.
     * @param actor the account paying
     * @param payment the value attached to the call
     * @param memo the ledger memo
     */
    inline void lease_payment(const name &actor, const asset &payment, const string &memo) {
        if (payment.amount > 0) {
            action(permission_level{RegistryContract, ACTIVE},
                   TokenContract, "transfer"_n,
                   make_tuple(actor, RegistryContract, payment, memo)
            ).send();
        }
    }

} // namespace leaseio

/** LeaseAccounts definitions file
 *  Description: holds the account names and token symbol used by the lease registry contracts
 *  @file lease.accounts.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#define MAX_TRX_SIZE 8098

namespace leaseio {
    using eosio::name;

    static const name RegistryContract =  name("lease.domain");
    static const name TokenContract =     name("lease.token");

    static constexpr name LEASEISSUER = name("eosio"_n);
    static constexpr eosio::symbol LEASESYMBOL = eosio::symbol("LEASE", 9);
    //active permission
    static const name ACTIVE = name("active");

} // namespace leaseio

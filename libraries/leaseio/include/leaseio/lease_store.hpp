/** LeaseStore definitions file
 *  Description: Row level helpers for the lease table. A lease row carries id, domain, domainhash and the
 *               four lease fields; the table type only needs the multi_index calls used below, so the same
 *               code runs against the contract tables and against in-memory tables.
 *  @file lease_store.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 *
 *  Changes:
 */

#pragma once

#include <string>
#include "lease_policy.hpp"

namespace leaseio {

    template<typename Row>
    inline lease_terms row_terms(const Row &row) {
        lease_terms terms;
        terms.owner = row.owner_account;
        terms.registered_at = row.registered_at;
        terms.duration_years = row.duration_years;
        terms.paid_amount = row.paid_amount;
        return terms;
    }

    template<typename Row>
    inline void assign_terms(Row &row, const lease_terms &terms) {
        row.owner_account = terms.owner;
        row.registered_at = terms.registered_at;
        row.duration_years = terms.duration_years;
        row.paid_amount = terms.paid_amount;
    }

    /***
     * Finds the row for a domain. Rows are located through the name hash index, then compared on the full
     * string, so two names share a row only when they are exactly equal.
     * @param table the lease table
     * @param byname the hash index of the table
     * @param domainhash the hash of domain
     * @param domain the domain name
     * @return an iterator into table, table.end() when the domain was never registered
     */
    template<typename Table, typename Index, typename Hash>
    inline typename Table::const_iterator find_named(const Table &table, const Index &byname, const Hash &domainhash,
                                                     const std::string &domain) {
        for (auto iter = byname.lower_bound(domainhash);
             iter != byname.end() && iter->domainhash == domainhash; ++iter) {
            if (iter->domain == domain) {
                return table.find(iter->id);
            }
        }
        return table.end();
    }

    // rewrites the lease fields of an existing row in place, or adds the first row for the domain
    template<typename Table, typename Payer, typename Hash>
    inline void put_named(Table &table, typename Table::const_iterator iter, const Payer &payer,
                          const std::string &domain, const Hash &domainhash, const lease_terms &terms) {
        if (iter != table.end()) {
            table.modify(iter, payer, [&](auto &row) {
                assign_terms(row, terms);
            });
            return;
        }

        const uint64_t id = table.available_primary_key();
        table.emplace(payer, [&](auto &row) {
            row.id = id;
            row.domain = domain;
            row.domainhash = domainhash;
            assign_terms(row, terms);
        });
    }
}

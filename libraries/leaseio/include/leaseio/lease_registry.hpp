/** LeaseRegistry engine definitions file
 *  Description: The registry actions, run against a lease store, a value ledger and an event sink. Every
 *               action evaluates all of its preconditions before the first write, and reports failures as
 *               lease error codes; the caller decides how a code aborts the surrounding transaction.
 *  @file lease_registry.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 *
 *  Changes:
 */

#pragma once

#include <string>
#include "leaseerror.hpp"
#include "lease_policy.hpp"
#include "lease_response.hpp"

namespace leaseio {

    using std::string;

    enum class lease_event_kind {
        registered,
        renewed,
        price_changed,
        multiplier_changed,
        paused,
        unpaused
    };

    // fields not carried by an event kind stay zero
    struct lease_event {
        lease_event_kind kind;
        string domain;
        uint64_t account = NOOWNER;
        uint64_t amount = 0;
        uint64_t years = 0;
    };

    class registry_store {
    public:
        virtual ~registry_store() {}

        virtual bool get_lease(const string &domain, lease_terms &terms) = 0;

        virtual void put_lease(const string &domain, const lease_terms &terms) = 0;

        virtual bool get_config(registry_params &params) = 0;

        virtual void set_config(const registry_params &params) = 0;

        virtual string account_string(uint64_t account) const = 0;
    };

    class registry_ledger {
    public:
        virtual ~registry_ledger() {}

        // moves amount from actor into the registry custody, LeaseOk or ErrorLowFunds
        virtual uint64_t collect(uint64_t actor, uint64_t amount) = 0;

        virtual uint64_t custody_balance() = 0;

        virtual void pay_out(uint64_t to, uint64_t amount) = 0;
    };

    class registry_events {
    public:
        virtual ~registry_events() {}

        virtual void emit(const lease_event &event) = 0;
    };

    class lease_registry {
    public:
        lease_registry(registry_store &s, registry_ledger &l, registry_events &e) :
                store(s), ledger(l), events(e) {}

        uint64_t init(const uint64_t admin, const uint64_t price_per_year, const uint64_t renewal_multiplier,
                      string &response) {
            registry_params params;
            if (store.get_config(params)) {
                return ErrorAlreadyInitialized;
            }

            params.admin = admin;
            params.price_per_year = price_per_year;
            params.renewal_multiplier = renewal_multiplier;
            params.paused = false;
            store.set_config(params);

            response = config_response(params, store.account_string(admin));
            return LeaseOk;
        }

        /***
         * Claims a domain for actor. The domain must be unregistered or lapsed; the stored lease is fully
         * overwritten and the whole amount is collected.
         * @param domain the domain name
         * @param years the lease years, 1 to 10
         * @param amount the value attached to the claim
         * @param actor the claiming account
         * @param present_time the current block time
         * @param response receives the status body on success
         * @return LeaseOk or the error code of the first failing precondition
         */
        uint64_t claim(const string &domain, const int64_t years, const int64_t amount, const uint64_t actor,
                       const uint64_t present_time, string &response) {
            if (!is_valid_lease_amount(amount)) {
                return ErrorInvalidAmount;
            }
            registry_params params;
            if (!store.get_config(params)) {
                return ErrorNotInitialized;
            }

            lease_terms terms;
            const bool registered = store.get_lease(domain, terms);
            const uint64_t payment = static_cast<uint64_t>(amount);

            uint64_t result = check_claim(params, registered ? &terms : nullptr, years, payment, present_time);
            if (result != LeaseOk) {
                return result;
            }
            result = ledger.collect(actor, payment);
            if (result != LeaseOk) {
                return result;
            }

            apply_claim(terms, actor, present_time, years, payment);
            store.put_lease(domain, terms);

            lease_event event{lease_event_kind::registered, domain};
            event.account = actor;
            event.amount = payment;
            event.years = static_cast<uint64_t>(years);
            events.emit(event);

            response = status_response(lease_expiration(terms), payment);
            return LeaseOk;
        }

        // renewal keeps the owner and the registration time, years and paid amount accumulate
        uint64_t renew(const string &domain, const int64_t years, const int64_t amount, const uint64_t actor,
                       string &response) {
            if (!is_valid_lease_amount(amount)) {
                return ErrorInvalidAmount;
            }
            registry_params params;
            if (!store.get_config(params)) {
                return ErrorNotInitialized;
            }

            lease_terms terms;
            const bool registered = store.get_lease(domain, terms);
            const uint64_t payment = static_cast<uint64_t>(amount);

            uint64_t result = check_renew(params, registered ? &terms : nullptr, years, payment, actor);
            if (result != LeaseOk) {
                return result;
            }
            result = ledger.collect(actor, payment);
            if (result != LeaseOk) {
                return result;
            }

            apply_renew(terms, years, payment);
            store.put_lease(domain, terms);

            lease_event event{lease_event_kind::renewed, domain};
            event.amount = payment;
            event.years = static_cast<uint64_t>(years);
            events.emit(event);

            response = status_response(lease_expiration(terms), payment);
            return LeaseOk;
        }

        string owner(const string &domain) {
            lease_terms terms;
            if (!store.get_lease(domain, terms)) {
                return owner_response(domain, string(""));
            }
            return owner_response(domain, store.account_string(terms.owner));
        }

        string info(const string &domain, const uint64_t present_time) {
            lease_terms terms;
            if (!store.get_lease(domain, terms)) {
                return info_response(domain, nullptr, string(""), present_time);
            }
            return info_response(domain, &terms, store.account_string(terms.owner), present_time);
        }

        string availability(const string &domain, const uint64_t present_time) {
            lease_terms terms;
            if (!store.get_lease(domain, terms)) {
                return availability_response(nullptr, present_time);
            }
            return availability_response(&terms, present_time);
        }

        uint64_t config(string &response) {
            registry_params params;
            if (!store.get_config(params)) {
                return ErrorNotInitialized;
            }
            response = config_response(params, store.account_string(params.admin));
            return LeaseOk;
        }

        uint64_t set_price(const uint64_t new_price, const uint64_t actor, string &response) {
            registry_params params;
            const uint64_t result = load_for_admin(actor, params);
            if (result != LeaseOk) {
                return result;
            }

            params.price_per_year = new_price;
            store.set_config(params);

            lease_event event{lease_event_kind::price_changed};
            event.amount = new_price;
            events.emit(event);

            response = config_response(params, store.account_string(params.admin));
            return LeaseOk;
        }

        uint64_t set_multiplier(const uint64_t new_multiplier, const uint64_t actor, string &response) {
            registry_params params;
            const uint64_t result = load_for_admin(actor, params);
            if (result != LeaseOk) {
                return result;
            }

            params.renewal_multiplier = new_multiplier;
            store.set_config(params);

            lease_event event{lease_event_kind::multiplier_changed};
            event.amount = new_multiplier;
            events.emit(event);

            response = config_response(params, store.account_string(params.admin));
            return LeaseOk;
        }

        // repeating a pause or unpause succeeds and emits again
        uint64_t set_paused(const bool paused, const uint64_t actor, string &response) {
            registry_params params;
            const uint64_t result = load_for_admin(actor, params);
            if (result != LeaseOk) {
                return result;
            }

            params.paused = paused;
            store.set_config(params);

            lease_event event{paused ? lease_event_kind::paused : lease_event_kind::unpaused};
            event.account = actor;
            events.emit(event);

            response = config_response(params, store.account_string(params.admin));
            return LeaseOk;
        }

        // an empty custody succeeds without touching the ledger
        uint64_t withdraw(const uint64_t actor, string &response) {
            registry_params params;
            const uint64_t result = load_for_admin(actor, params);
            if (result != LeaseOk) {
                return result;
            }

            const uint64_t balance = ledger.custody_balance();
            if (balance > 0) {
                ledger.pay_out(params.admin, balance);
            }

            response = withdraw_response(balance);
            return LeaseOk;
        }

        uint64_t deposit(const int64_t amount, const uint64_t actor, string &response) {
            if (!is_valid_lease_amount(amount)) {
                return ErrorInvalidAmount;
            }
            const uint64_t result = ledger.collect(actor, static_cast<uint64_t>(amount));
            if (result != LeaseOk) {
                return result;
            }

            response = deposit_response(static_cast<uint64_t>(amount));
            return LeaseOk;
        }

    private:
        registry_store &store;
        registry_ledger &ledger;
        registry_events &events;

        uint64_t load_for_admin(const uint64_t actor, registry_params &params) {
            if (!store.get_config(params)) {
                return ErrorNotInitialized;
            }
            return check_admin(params, actor);
        }
    };
}

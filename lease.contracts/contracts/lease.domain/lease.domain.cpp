/** LeaseRegistry implementation file
 *  Description: LeaseRegistry smart contract leases human readable domain names for a paid number of years.
 *               Leases may be renewed by their owner, reclaimed by anyone once lapsed, and the registry admin
 *               controls pricing, the renewal multiplier and an emergency pause.
 *  @file lease.domain.cpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#include "lease.domain.hpp"
#include <lease.common/lease.common.hpp>
#include <lease.token/include/lease.token/lease.token.hpp>
#include <leaseio/lease_registry.hpp>
#include <eosiolib/asset.hpp>

namespace leaseio {

    /***
     * Binds the registry engine to the contract tables, the lease.token ledger and the inline log actions.
     */
    class chain_registry_host : public registry_store, public registry_ledger, public registry_events {
    public:
        chain_registry_host(const name &self, leases_table &leases, regconfig_singleton &configs) :
                self(self), leases(leases), configs(configs) {}

        bool debugout = false;

        bool get_lease(const string &domain, lease_terms &terms) override {
            const auto leasesbyname = leases.get_index<"byname"_n>();
            const auto lease_iter = find_named(leases, leasesbyname, string_to_uint128_hash(domain), domain);
            if (lease_iter == leases.end()) {
                return false;
            }
            terms = row_terms(*lease_iter);
            return true;
        }

        void put_lease(const string &domain, const lease_terms &terms) override {
            const uint128_t domainHash = string_to_uint128_hash(domain);
            const auto leasesbyname = leases.get_index<"byname"_n>();
            const auto lease_iter = find_named(leases, leasesbyname, domainHash, domain);
            put_named(leases, lease_iter, self, domain, domainHash, terms);
        }

        bool get_config(registry_params &params) override {
            if (!configs.exists()) {
                return false;
            }
            params = configs.get().params();
            return true;
        }

        void set_config(const registry_params &params) override {
            configs.set(regconfig::from_params(params), self);
        }

        string account_string(uint64_t account) const override {
            return name(account).to_string();
        }

        // the ledger aborts the whole transaction when the actor cannot cover the payment
        uint64_t collect(uint64_t actor, uint64_t amount) override {
            lease_payment(name(actor), asset(static_cast<int64_t>(amount), LEASESYMBOL),
                          string("Domain lease registry payment. Thank you."));
            return LeaseOk;
        }

        uint64_t custody_balance() override {
            const asset balance = eosio::token::get_balance(TokenContract, self, LEASESYMBOL.code());
            return static_cast<uint64_t>(balance.amount);
        }

        void pay_out(uint64_t to, uint64_t amount) override {
            action(permission_level{self, ACTIVE},
                   TokenContract, "transfer"_n,
                   make_tuple(self, name(to), asset(static_cast<int64_t>(amount), LEASESYMBOL),
                              string("Lease registry withdrawal."))
            ).send();
        }

        void emit(const lease_event &event) override {
            switch (event.kind) {
                case lease_event_kind::registered:
                    action(permission_level{self, ACTIVE}, self, "logregister"_n,
                           std::make_tuple(event.domain, name(event.account), event.amount, event.years)).send();
                    break;
                case lease_event_kind::renewed:
                    action(permission_level{self, ACTIVE}, self, "logrenew"_n,
                           std::make_tuple(event.domain, event.years, event.amount)).send();
                    break;
                case lease_event_kind::price_changed:
                    action(permission_level{self, ACTIVE}, self, "logprice"_n,
                           std::make_tuple(event.amount)).send();
                    break;
                case lease_event_kind::multiplier_changed:
                    action(permission_level{self, ACTIVE}, self, "logmult"_n,
                           std::make_tuple(event.amount)).send();
                    break;
                case lease_event_kind::paused:
                    action(permission_level{self, ACTIVE}, self, "logpause"_n,
                           std::make_tuple(name(event.account))).send();
                    break;
                case lease_event_kind::unpaused:
                    action(permission_level{self, ACTIVE}, self, "logunpause"_n,
                           std::make_tuple(name(event.account))).send();
                    break;
            }

            if (debugout) {
                print("lease event for ", event.domain, " account ", name(event.account), " amount ", event.amount,
                      "\n");
            }
        }

    private:
        name self;
        leases_table &leases;
        regconfig_singleton &configs;
    };

    class [[eosio::contract("LeaseRegistry")]]  LeaseRegistry : public eosio::contract {

    private:
        leases_table leases;
        regconfig_singleton configs;
        chain_registry_host host;
        lease_registry registry;

    public:
        LeaseRegistry(name s, name code, datastream<const char *> ds) : contract(s, code, ds),
                                                                        leases(_self, _self.value),
                                                                        configs(_self, _self.value),
                                                                        host(_self, leases, configs),
                                                                        registry(host, host, host) {
        }

        /***
         * Raises the coded assertion matching a failed registry result.
         * @param result the registry result, LeaseOk passes
         * @param subject the domain, or the admin account for init
         * @param years the requested years as given
         * @param amount the attached amount as given
         */
        inline void assert_registry_result(const uint64_t result, const string &subject, const string &years,
                                           const string &amount) {
            switch (result) {
                case LeaseOk:
                    return;
                case ErrorContractPaused:
                case ErrorNotOwner:
                case ErrorUnauthorized:
                    lease_403_assert(false, result);
                    break;
                case ErrorNotInitialized:
                    lease_404_assert(false, "Lease registry is not initialized", result);
                    break;
                case ErrorDomainStillActive:
                    lease_400_assert(false, "domain", subject, "Domain lease is still active", result);
                    break;
                case ErrorAlreadyInitialized:
                    lease_400_assert(false, "admin", subject, "Lease registry already initialized", result);
                    break;
                case ErrorInvalidDuration:
                    lease_400_assert(false, "years", years, "Lease years must be between 1 and 10", result);
                    break;
                case ErrorInsufficientPayment:
                    lease_400_assert(false, "amount", amount, "Insufficient payment for lease", result);
                    break;
                case ErrorInvalidAmount:
                    lease_400_assert(false, "amount", amount, "Invalid amount value", result);
                    break;
                case ErrorLowFunds:
                    lease_400_assert(false, "amount", amount, "Insufficient funds to cover payment", result);
                    break;
                default:
                    eosio_assert_message_code(false, "Unexpected lease registry result", result);
            }
        }

        inline void assert_transaction_size() {
            lease_400_assert(transaction_size() <= MAX_TRX_SIZE, "transaction_size", std::to_string(transaction_size()),
                             "Transaction is too large", ErrorTransactionTooLarge);
        }

        /********* CONTRACT ACTIONS ********/

        /***
         * This action sets up the registry configuration. It can only run once, the configuration is never
         * rebuilt afterwards, only changed through the admin actions.
         * @param admin the account allowed to change pricing, pause the registry and withdraw funds
         * @param price_per_year the price of one lease year
         * @param renewal_multiplier the factor applied to the yearly price when renewing
         */
        [[eosio::action]]
        void init(const name &admin, const uint64_t &price_per_year, const uint64_t &renewal_multiplier) {
            require_auth(get_self());
            check(is_account(admin), "admin account does not exist");

            string response;
            const uint64_t result = registry.init(admin.value, price_per_year, renewal_multiplier, response);
            assert_registry_result(result, admin.to_string(), "", "");

            send_response(response.c_str());
        }

        /***
         * This action claims a domain for the actor. The domain must be unregistered or its lease lapsed,
         * the record is fully overwritten and the whole attached amount is collected.
         * @param domain the domain name to lease
         * @param years the number of lease years, 1 to 10
         * @param amount the value attached to the claim, collected into the registry custody
         * @param actor the account claiming the domain
         */
        [[eosio::action]]
        void claim(const string &domain, const int64_t &years, const int64_t &amount, const name &actor) {
            require_auth(actor);

            string response;
            const uint64_t result = registry.claim(domain, years, amount, actor.value, now(), response);
            assert_registry_result(result, domain, to_string(years), to_string(amount));

            if (host.debugout) {
                print("claimed ", domain, " for ", actor, "\n");
            }

            assert_transaction_size();
            send_response(response.c_str());
        }

        /***********
         * This action renews a domain lease. Only the recorded owner may renew, and the lease may already be
         * lapsed as long as nobody else reclaimed it. The registration time is kept, the years accumulate.
         * @param domain the domain to renew
         * @param years the number of years added, 1 to 10
         * @param amount the value attached to the renewal
         * @param actor the account requesting the renewal
         */
        [[eosio::action]]
        void renew(const string &domain, const int64_t &years, const int64_t &amount, const name &actor) {
            require_auth(actor);

            string response;
            const uint64_t result = registry.renew(domain, years, amount, actor.value, response);
            assert_registry_result(result, domain, to_string(years), to_string(amount));

            assert_transaction_size();
            send_response(response.c_str());
        }

        [[eosio::action]]
        void getowner(const string &domain) {
            send_response(registry.owner(domain).c_str());
        }

        [[eosio::action]]
        void getinfo(const string &domain) {
            send_response(registry.info(domain, now()).c_str());
        }

        // reports whether a claim on the domain would be refused because its lease is still active
        [[eosio::action]]
        void availcheck(const string &domain) {
            send_response(registry.availability(domain, now()).c_str());
        }

        [[eosio::action]]
        void getconfig() {
            string response;
            assert_registry_result(registry.config(response), "", "", "");
            send_response(response.c_str());
        }

        [[eosio::action]]
        void setprice(const uint64_t &new_price, const name &actor) {
            require_auth(actor);

            string response;
            assert_registry_result(registry.set_price(new_price, actor.value, response), "", "", "");
            send_response(response.c_str());
        }

        [[eosio::action]]
        void setmult(const uint64_t &new_multiplier, const name &actor) {
            require_auth(actor);

            string response;
            assert_registry_result(registry.set_multiplier(new_multiplier, actor.value, response), "", "", "");
            send_response(response.c_str());
        }

        [[eosio::action]]
        void pause(const name &actor) {
            require_auth(actor);

            string response;
            assert_registry_result(registry.set_paused(true, actor.value, response), "", "", "");
            send_response(response.c_str());
        }

        [[eosio::action]]
        void unpause(const name &actor) {
            require_auth(actor);

            string response;
            assert_registry_result(registry.set_paused(false, actor.value, response), "", "", "");
            send_response(response.c_str());
        }

        /***
         * This action moves the whole custodial balance of the registry to the admin account.
         * Lease records are not touched.
         * @param actor must be the registry admin
         */
        [[eosio::action]]
        void withdraw(const name &actor) {
            require_auth(actor);

            string response;
            assert_registry_result(registry.withdraw(actor.value, response), "", "", "");
            send_response(response.c_str());
        }

        // accepts value into the registry custody without touching any lease
        [[eosio::action]]
        void deposit(const int64_t &amount, const name &actor) {
            require_auth(actor);

            string response;
            assert_registry_result(registry.deposit(amount, actor.value, response), "", "", to_string(amount));
            send_response(response.c_str());
        }

        /********* NOTIFICATIONS ********/
        // sent inline by the registry after the mutation they describe, they carry no state of their own

        [[eosio::action]]
        void logregister(const string &domain, const name &owner, const uint64_t &amount, const uint64_t &years) {
            require_auth(get_self());
        }

        [[eosio::action]]
        void logrenew(const string &domain, const uint64_t &years, const uint64_t &amount) {
            require_auth(get_self());
        }

        [[eosio::action]]
        void logprice(const uint64_t &new_price) {
            require_auth(get_self());
        }

        [[eosio::action]]
        void logmult(const uint64_t &new_multiplier) {
            require_auth(get_self());
        }

        [[eosio::action]]
        void logpause(const name &actor) {
            require_auth(get_self());
        }

        [[eosio::action]]
        void logunpause(const name &actor) {
            require_auth(get_self());
        }
    };

    EOSIO_DISPATCH(LeaseRegistry, (init)(claim)(renew)(getowner)(getinfo)(availcheck)(getconfig)
                                  (setprice)(setmult)(pause)(unpause)(withdraw)(deposit)
                                  (logregister)(logrenew)(logprice)(logmult)(logpause)(logunpause))
}

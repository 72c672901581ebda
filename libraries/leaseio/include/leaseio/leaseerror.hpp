/** LeaseError definitions file
 *  Description: Error codes raised by the lease registry contracts, plus helpers that format the
 *               http error bodies returned by the messaging layer when an assertion test fails.
 *  @file leaseerror.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 *
 *  Changes:
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "leasejson.hpp"

namespace leaseio {
    using std::string;
    using std::vector;

    /**
     * error code definition. Error codes are bitfielded uint64_t values.
     * The fields are: An identifier, 'LSE\0', then http error code and finally a registry specific error number.
     */

    constexpr auto identOffset = 48;
    constexpr uint64_t ident =
            uint64_t((('L' << 4) | 'S' << 4) | 'E') << identOffset; // to distinguish the error codes generically
    constexpr auto httpOffset = 32;
    constexpr uint64_t httpDataError = 400ULL << httpOffset;
    constexpr uint64_t httpInvalidError = 403ULL << httpOffset;
    constexpr uint64_t httpLocationError = 404ULL << httpOffset;
    constexpr uint64_t httpMask = 0xfffULL << httpOffset;
    constexpr uint64_t ecCodeMask = 0xff;

    constexpr auto ErrorDomainStillActive = ident | httpDataError | 100;     // lease has not expired yet
    constexpr auto ErrorInvalidDuration = ident | httpDataError | 101;       // years outside [1,10]
    constexpr auto ErrorInsufficientPayment = ident | httpDataError | 102;   // payment below required price
    constexpr auto ErrorNotOwner = ident | httpInvalidError | 103;           // caller does not hold the lease
    constexpr auto ErrorUnauthorized = ident | httpInvalidError | 104;       // caller is not the admin
    constexpr auto ErrorContractPaused = ident | httpInvalidError | 105;     // registry is paused
    constexpr auto ErrorInvalidAmount = ident | httpDataError | 106;         // negative value attached
    constexpr auto ErrorAlreadyInitialized = ident | httpDataError | 107;
    constexpr auto ErrorNotInitialized = ident | httpLocationError | 108;
    constexpr auto ErrorLowFunds = ident | httpDataError | 109;              // Insufficient balance
    constexpr auto ErrorTransactionTooLarge = ident | httpDataError | 110;   // Transaction too large

    /**
    * Helper functions for detecting rich error messages and extracting bitfielded values
    */

    inline bool is_lease_error(uint64_t ec) {
        constexpr uint64_t mask = ident | httpMask | ecCodeMask;
        return (ec & ident) == ident && (ec & ~mask) == 0;
    }

    inline uint16_t get_http_result(uint64_t ec) {
        return static_cast<uint16_t>((ec & httpMask) >> httpOffset);
    }

    inline uint64_t get_lease_code(uint64_t ec) {
        return ec & ecCodeMask;
    }

    inline const char *error_name(uint64_t ec) {
        switch (ec) {
            case ErrorDomainStillActive:
                return "DomainStillActive";
            case ErrorInvalidDuration:
                return "InvalidDuration";
            case ErrorInsufficientPayment:
                return "InsufficientPayment";
            case ErrorNotOwner:
                return "NotOwner";
            case ErrorUnauthorized:
                return "Unauthorized";
            case ErrorContractPaused:
                return "ContractPaused";
            case ErrorInvalidAmount:
                return "InvalidAmount";
            case ErrorAlreadyInitialized:
                return "AlreadyInitialized";
            case ErrorNotInitialized:
                return "NotInitialized";
            case ErrorLowFunds:
                return "LowFunds";
            case ErrorTransactionTooLarge:
                return "TransactionTooLarge";
            default:
                return "Unknown";
        }
    }

    /**
     * Structures used to collect error content and format proper result messages
     */

    struct Http_Result {
        string type;
        string message;

        Http_Result(const string &t = "", const string &m = "") : type(t), message(m) {}
    };

    struct Code_400_Result : public Http_Result {
        struct field {
            string name = "";
            string value = "";
            string error = "";
        };

        vector<field> fields;

        Code_400_Result(const string &fname = "", const string &fval = "", const string &ferr = "") :
                Http_Result("invalid_input",
                            "An invalid request was sent in, please check the nested errors for details.") {
            add_field({fname, fval, ferr});
        }

        void add_field(const field &f) {
            fields.push_back(f);
        }

        string to_json() const {
            string json_str = "{\n  \"type\": \"" + json_escape(type) +
                              "\",\n  \"message\": \"" + json_escape(message) + "\",\n  \"fields\": [\n";
            for (auto f = fields.cbegin(); f != fields.cend(); f++) {
                if (f != fields.cbegin()) json_str += ",\n";
                json_str += "    {\"name\": \"" + json_escape(f->name) +
                            "\",\n    \"value\": \"" + json_escape(f->value) +
                            "\",\n    \"error\": \"" + json_escape(f->error) + "\"}";
            }
            json_str += "]\n}\n";
            return json_str;
        }
    };

    struct Code_403_Result : public Http_Result {
        Code_403_Result(uint64_t code) :
                Http_Result("invalid_signature", "Request signature not valid or not allowed.") {
            if (code == ErrorUnauthorized) {
                type = "unauthorized";
                message = "Only the registry admin may perform this action";
            }
            if (code == ErrorNotOwner) {
                type = "not_owner";
                message = "Only the current leaseholder may perform this action";
            }
            if (code == ErrorContractPaused) {
                type = "paused";
                message = "The registry is paused";
            }
        }

        string to_json() const {
            string json_str = "{\n  \"type\": \"" + json_escape(type) +
                              "\",\n  \"message\": \"" + json_escape(message) + "\"\n}\n";
            return json_str;
        }
    };

    struct Code_404_Result : public Http_Result {
        Code_404_Result(const string &msg) :
                Http_Result("", msg) {}

        string to_json() const {
            string json_str = "{\n  \"message\": \"" + json_escape(message) + "\"\n}\n";
            return json_str;
        }
    };

} // namespace leaseio

/**
 * helper macros that hide the string conversion tedium
 */

#define lease_400_assert(test, fieldname, fieldvalue, fielderror, code) \
   eosio_assert_message_code(test, leaseio::Code_400_Result(fieldname, fieldvalue, fielderror).to_json().c_str(), code)

#define lease_403_assert(test, code) \
   eosio_assert_message_code(test, leaseio::Code_403_Result(code).to_json().c_str(), code)

#define lease_404_assert(test, message, code) \
   eosio_assert_message_code(test, leaseio::Code_404_Result(message).to_json().c_str(), code)

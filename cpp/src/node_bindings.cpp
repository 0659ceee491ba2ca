#define NAPI_VERSION 8
#include <node_api.h>

#include "strata/error.hpp"
#include "strata/market_state.hpp"
#include "strata/processor.hpp"

#include <cstdint>
#include <functional>
#include <new>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * Node.js N-API host adapter for the Strata market engine
 *
 * The JavaScript host owns the persisted regions as Buffers; execute()
 * mutates them in place and reports the token transfers the host must
 * apply. Buffers are left untouched when the status is not OK.
 */

namespace strata::bindings {

// Helper macros for N-API error handling
#define NAPI_CALL(env, call)                                      \
  do {                                                            \
    napi_status status = (call);                                  \
    if (status != napi_ok) {                                      \
      napi_throw_error(env, nullptr, "N-API call failed");        \
      return nullptr;                                             \
    }                                                             \
  } while(0)

#define NAPI_ASSERT(env, condition, message)                      \
  do {                                                            \
    if (!(condition)) {                                           \
      napi_throw_error(env, nullptr, message);                    \
      return nullptr;                                             \
    }                                                             \
  } while(0)

/**
 * Balances the host is willing to deposit, keyed by (account, asset)
 */
class MapFundingSource final : public engine::FundingSource {
public:
    void set(uint64_t account, Asset asset, uint64_t amount) {
        balances_[key(account, asset)] = amount;
    }

    [[nodiscard]] uint64_t available(uint64_t account, Asset asset) const override {
        const auto it = balances_.find(key(account, asset));
        return it == balances_.end() ? 0 : it->second;
    }

private:
    [[nodiscard]] static std::pair<uint64_t, uint8_t> key(uint64_t account, Asset asset) noexcept {
        return {account, static_cast<uint8_t>(asset)};
    }

    struct KeyHash {
        size_t operator()(const std::pair<uint64_t, uint8_t>& k) const noexcept {
            return std::hash<uint64_t>{}(k.first * 2 + k.second);
        }
    };

    std::unordered_map<std::pair<uint64_t, uint8_t>, uint64_t, KeyHash> balances_;
};

// u64 from either a BigInt or a non-negative safe integer Number
bool get_uint64(napi_env env, napi_value value, uint64_t& out) {
    napi_valuetype type;
    if (napi_typeof(env, value, &type) != napi_ok) return false;
    if (type == napi_bigint) {
        bool lossless = false;
        return napi_get_value_bigint_uint64(env, value, &out, &lossless) == napi_ok && lossless;
    }
    if (type == napi_number) {
        int64_t v = 0;
        if (napi_get_value_int64(env, value, &v) != napi_ok || v < 0) return false;
        out = static_cast<uint64_t>(v);
        return true;
    }
    return false;
}

bool get_named_uint64(napi_env env, napi_value obj, const char* name, uint64_t& out) {
    bool has = false;
    if (napi_has_named_property(env, obj, name, &has) != napi_ok || !has) return false;
    napi_value value;
    if (napi_get_named_property(env, obj, name, &value) != napi_ok) return false;
    return get_uint64(env, value, out);
}

// Absent properties leave `out` unchanged; present ones must fit in 32 bits
bool get_named_capacity(napi_env env, napi_value obj, const char* name, uint32_t& out) {
    bool has = false;
    if (napi_has_named_property(env, obj, name, &has) != napi_ok) return false;
    if (!has) return true;
    uint64_t value = 0;
    if (!get_named_uint64(env, obj, name, value) || value > UINT32_MAX) return false;
    out = static_cast<uint32_t>(value);
    return true;
}

bool get_buffer(napi_env env, napi_value value, uint8_t*& data, size_t& length) {
    bool is_buffer = false;
    if (napi_is_buffer(env, value, &is_buffer) != napi_ok || !is_buffer) return false;
    void* raw = nullptr;
    if (napi_get_buffer_info(env, value, &raw, &length) != napi_ok) return false;
    data = static_cast<uint8_t*>(raw);
    return true;
}

void set_property_uint32(napi_env env, napi_value obj, const char* name, uint32_t value) {
    napi_value nval;
    napi_create_uint32(env, value, &nval);
    napi_set_named_property(env, obj, name, nval);
}

void set_property_bigint(napi_env env, napi_value obj, const char* name, uint64_t value) {
    napi_value nval;
    napi_create_bigint_uint64(env, value, &nval);
    napi_set_named_property(env, obj, name, nval);
}

void set_property_string(napi_env env, napi_value obj, const char* name, const char* value) {
    napi_value nval;
    napi_create_string_utf8(env, value, NAPI_AUTO_LENGTH, &nval);
    napi_set_named_property(env, obj, name, nval);
}

//=============================================================================
// MARKET BINDINGS
//=============================================================================

/**
 * requiredSize({ bidsCapacity, asksCapacity, requestCapacity, eventCapacity }): number
 * Omitted capacities take the MarketConfig defaults.
 */
napi_value RequiredSize(napi_env env, napi_callback_info info) {
    size_t argc = 1;
    napi_value args[1];
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));

    market::MarketConfig config;
    if (argc >= 1) {
        NAPI_ASSERT(env, get_named_capacity(env, args[0], "bidsCapacity", config.bids_capacity),
                    "bidsCapacity must be an unsigned 32-bit integer");
        NAPI_ASSERT(env, get_named_capacity(env, args[0], "asksCapacity", config.asks_capacity),
                    "asksCapacity must be an unsigned 32-bit integer");
        NAPI_ASSERT(env, get_named_capacity(env, args[0], "requestCapacity", config.request_capacity),
                    "requestCapacity must be an unsigned 32-bit integer");
        NAPI_ASSERT(env, get_named_capacity(env, args[0], "eventCapacity", config.event_capacity),
                    "eventCapacity must be an unsigned 32-bit integer");
    }

    napi_value result;
    NAPI_CALL(env, napi_create_double(env, static_cast<double>(market::MarketState::required_size(config)), &result));
    return result;
}

/**
 * execute(market: Buffer,
 *         openOrders: Array<{ id: bigint, data: Buffer }>,
 *         instruction: Buffer,
 *         signer: bigint,
 *         funding?: Array<{ account: bigint, base: bigint, quote: bigint }>)
 * Returns: { status, statusName, transfers: [...], eventsConsumed, requestsProcessed,
 *            orderIdHi, orderIdLo, baseFilled, postedQuantity }
 */
napi_value ExecuteInvocation(napi_env env, napi_callback_info info) {
    size_t argc = 5;
    napi_value args[5];
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 4, "Expected at least 4 arguments: market, openOrders, instruction, signer");

    engine::InvocationContext context;
    NAPI_ASSERT(env, get_buffer(env, args[0], context.market, context.market_length),
                "market must be a Buffer");

    uint32_t account_count = 0;
    NAPI_CALL(env, napi_get_array_length(env, args[1], &account_count));
    for (uint32_t i = 0; i < account_count; ++i) {
        napi_value entry;
        NAPI_CALL(env, napi_get_element(env, args[1], i, &entry));
        engine::AccountRegion region{};
        NAPI_ASSERT(env, get_named_uint64(env, entry, "id", region.id), "openOrders[i].id must be a bigint");
        napi_value data;
        NAPI_CALL(env, napi_get_named_property(env, entry, "data", &data));
        NAPI_ASSERT(env, get_buffer(env, data, region.data, region.length), "openOrders[i].data must be a Buffer");
        context.open_orders.push_back(region);
    }

    uint8_t* instruction = nullptr;
    size_t instruction_length = 0;
    NAPI_ASSERT(env, get_buffer(env, args[2], instruction, instruction_length),
                "instruction must be a Buffer");
    NAPI_ASSERT(env, get_uint64(env, args[3], context.signer), "signer must be a bigint");

    MapFundingSource funding;
    if (argc >= 5) {
        uint32_t funding_count = 0;
        NAPI_CALL(env, napi_get_array_length(env, args[4], &funding_count));
        for (uint32_t i = 0; i < funding_count; ++i) {
            napi_value entry;
            NAPI_CALL(env, napi_get_element(env, args[4], i, &entry));
            uint64_t account = 0;
            uint64_t base = 0;
            uint64_t quote = 0;
            NAPI_ASSERT(env, get_named_uint64(env, entry, "account", account), "funding[i].account must be a bigint");
            if (get_named_uint64(env, entry, "base", base)) funding.set(account, Asset::BASE, base);
            if (get_named_uint64(env, entry, "quote", quote)) funding.set(account, Asset::QUOTE, quote);
        }
    }
    context.funding = &funding;

    engine::Processor processor(std::move(context));
    const engine::InvocationResult outcome = processor.execute(instruction, instruction_length);

    napi_value result;
    NAPI_CALL(env, napi_create_object(env, &result));
    set_property_uint32(env, result, "status", static_cast<uint32_t>(outcome.status));
    set_property_string(env, result, "statusName", error_name(outcome.status));
    set_property_uint32(env, result, "eventsConsumed", outcome.events_consumed);
    set_property_uint32(env, result, "requestsProcessed", outcome.requests_processed);
    set_property_bigint(env, result, "orderIdHi", outcome.order_id.hi);
    set_property_bigint(env, result, "orderIdLo", outcome.order_id.lo);
    set_property_bigint(env, result, "baseFilled", outcome.base_filled);
    set_property_bigint(env, result, "postedQuantity", outcome.posted_quantity);

    napi_value transfers;
    NAPI_CALL(env, napi_create_array_with_length(env, outcome.transfers.size(), &transfers));
    for (size_t i = 0; i < outcome.transfers.size(); ++i) {
        const engine::TokenTransfer& t = outcome.transfers[i];
        napi_value obj;
        NAPI_CALL(env, napi_create_object(env, &obj));
        set_property_string(env, obj, "kind", t.kind == engine::TransferKind::DEPOSIT ? "deposit" : "withdraw");
        set_property_string(env, obj, "asset", t.asset == Asset::BASE ? "base" : "quote");
        set_property_bigint(env, obj, "account", t.account);
        set_property_bigint(env, obj, "amount", t.amount);
        NAPI_CALL(env, napi_set_element(env, transfers, static_cast<uint32_t>(i), obj));
    }
    NAPI_CALL(env, napi_set_named_property(env, result, "transfers", transfers));

    return result;
}

// Allocation failures surface as a JavaScript error; the processor has
// already restored the regions by the time one reaches here
napi_value Execute(napi_env env, napi_callback_info info) {
    try {
        return ExecuteInvocation(env, info);
    } catch (const std::bad_alloc&) {
        napi_throw_error(env, nullptr, "out of memory");
        return nullptr;
    }
}

//=============================================================================
// MODULE INITIALIZATION
//=============================================================================

napi_value Init(napi_env env, napi_value exports) {
    napi_value fn;

    napi_create_function(env, nullptr, 0, RequiredSize, nullptr, &fn);
    napi_set_named_property(env, exports, "requiredSize", fn);

    napi_create_function(env, nullptr, 0, Execute, nullptr, &fn);
    napi_set_named_property(env, exports, "execute", fn);

    return exports;
}

NAPI_MODULE(NODE_GYP_MODULE_NAME, Init)

} // namespace strata::bindings

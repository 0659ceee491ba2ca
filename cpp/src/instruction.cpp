#include "strata/instruction.hpp"

#include "strata/wire.hpp"

namespace strata::codec {

namespace {

// =============================================================================
// FIELD ENCODERS
// =============================================================================

void encode_fields(ByteWriter& w, const InitMarket& ix) noexcept {
    const market::MarketConfig& c = ix.config;
    w.put_uint64(c.market_id);
    w.put_uint64(c.base_vault);
    w.put_uint64(c.quote_vault);
    w.put_uint64(c.fee_receiver);
    w.put_uint64(c.prune_authority);
    w.put_uint64(c.consume_authority);
    w.put_uint64(c.referral_account);
    w.put_uint8(c.base_decimals);
    w.put_uint8(c.quote_decimals);
    w.put_uint64(c.base_lot_size);
    w.put_uint64(c.quote_lot_size);
    w.put_uint16(c.fee_tier_count);
    for (const market::FeeTier& tier : c.fee_tiers) {
        w.put_uint32(tier.taker_fee_bps);
        w.put_uint32(tier.maker_rebate_bps);
    }
    w.put_uint32(c.referrer_rebate_bps);
    w.put_uint32(c.bids_capacity);
    w.put_uint32(c.asks_capacity);
    w.put_uint32(c.request_capacity);
    w.put_uint32(c.event_capacity);
    w.put_uint8(static_cast<uint8_t>(c.request_policy));
    w.put_uint8(static_cast<uint8_t>(c.event_policy));
    w.put_uint16(c.max_match_steps);
}

void encode_fields(ByteWriter& w, const NewOrder& ix) noexcept {
    w.put_uint64(ix.owner);
    w.put_uint8(static_cast<uint8_t>(ix.side));
    w.put_uint8(static_cast<uint8_t>(ix.order_type));
    w.put_uint8(static_cast<uint8_t>(ix.self_trade));
    w.put_uint8(ix.fee_tier);
    w.put_uint16(ix.match_limit);
    w.put_uint64(ix.limit_price);
    w.put_uint64(ix.max_base_qty);
    w.put_uint64(ix.max_quote_qty);
    w.put_uint64(ix.client_order_id);
}

void encode_fields(ByteWriter& w, const CancelOrder& ix) noexcept {
    w.put_uint64(ix.owner);
    w.put_uint64(ix.order_id.hi);
    w.put_uint64(ix.order_id.lo);
}

void encode_fields(ByteWriter& w, const CancelOrderByClientId& ix) noexcept {
    w.put_uint64(ix.owner);
    w.put_uint64(ix.client_order_id);
}

void encode_fields(ByteWriter& w, const ConsumeEvents& ix) noexcept { w.put_uint16(ix.limit); }
void encode_fields(ByteWriter& w, const SettleFunds& ix) noexcept {
    w.put_uint64(ix.owner);
    w.put_uint64(ix.referrer);
}

void encode_fields(ByteWriter& w, const InitOpenOrders& ix) noexcept {
    w.put_uint64(ix.owner);
    w.put_uint64(ix.authority);
}

void encode_fields(ByteWriter& w, const CloseOpenOrders& ix) noexcept { w.put_uint64(ix.owner); }

void encode_fields(ByteWriter& w, const Prune& ix) noexcept {
    w.put_uint64(ix.owner);
    w.put_uint16(ix.limit);
}

void encode_fields(ByteWriter&, const SweepFees&) noexcept {}
void encode_fields(ByteWriter& w, const MatchOrders& ix) noexcept { w.put_uint16(ix.limit); }
void encode_fields(ByteWriter& w, const ConsumeEventsPermissioned& ix) noexcept { w.put_uint16(ix.limit); }

// =============================================================================
// FIELD DECODERS
// =============================================================================

/**
 * Sticky-failure wrapper: after the first short read or bad enum every
 * further read is a no-op and failed() stays true
 */
class FieldReader {
public:
    explicit FieldReader(ByteReader& reader) noexcept : reader_(reader) {}

    FieldReader& u8(uint8_t& out) noexcept { return take(reader_.get_uint8(), out); }
    FieldReader& u16(uint16_t& out) noexcept { return take(reader_.get_uint16(), out); }
    FieldReader& u32(uint32_t& out) noexcept { return take(reader_.get_uint32(), out); }
    FieldReader& u64(uint64_t& out) noexcept { return take(reader_.get_uint64(), out); }

    template<typename E>
    FieldReader& enumeration(E& out) noexcept {
        uint8_t raw = 0;
        u8(raw);
        out = static_cast<E>(raw);
        if (!is_valid(out)) failed_ = true;
        return *this;
    }

    [[nodiscard]] bool failed() const noexcept { return failed_; }

private:
    template<typename T>
    FieldReader& take(std::optional<T> value, T& out) noexcept {
        if (failed_) return *this;
        if (!value) {
            failed_ = true;
        } else {
            out = *value;
        }
        return *this;
    }

    ByteReader& reader_;
    bool failed_{false};
};

void decode_fields(FieldReader& r, InitMarket& ix) noexcept {
    market::MarketConfig& c = ix.config;
    r.u64(c.market_id).u64(c.base_vault).u64(c.quote_vault).u64(c.fee_receiver).u64(c.prune_authority);
    r.u64(c.consume_authority).u64(c.referral_account);
    r.u8(c.base_decimals).u8(c.quote_decimals);
    r.u64(c.base_lot_size).u64(c.quote_lot_size);
    r.u16(c.fee_tier_count);
    for (market::FeeTier& tier : c.fee_tiers) {
        r.u32(tier.taker_fee_bps).u32(tier.maker_rebate_bps);
    }
    r.u32(c.referrer_rebate_bps);
    r.u32(c.bids_capacity).u32(c.asks_capacity).u32(c.request_capacity).u32(c.event_capacity);
    r.enumeration(c.request_policy).enumeration(c.event_policy);
    r.u16(c.max_match_steps);
}

void decode_fields(FieldReader& r, NewOrder& ix) noexcept {
    r.u64(ix.owner);
    r.enumeration(ix.side).enumeration(ix.order_type).enumeration(ix.self_trade);
    r.u8(ix.fee_tier).u16(ix.match_limit);
    r.u64(ix.limit_price).u64(ix.max_base_qty).u64(ix.max_quote_qty).u64(ix.client_order_id);
}

void decode_fields(FieldReader& r, CancelOrder& ix) noexcept {
    r.u64(ix.owner).u64(ix.order_id.hi).u64(ix.order_id.lo);
}

void decode_fields(FieldReader& r, CancelOrderByClientId& ix) noexcept {
    r.u64(ix.owner).u64(ix.client_order_id);
}

void decode_fields(FieldReader& r, ConsumeEvents& ix) noexcept { r.u16(ix.limit); }
void decode_fields(FieldReader& r, SettleFunds& ix) noexcept { r.u64(ix.owner).u64(ix.referrer); }
void decode_fields(FieldReader& r, InitOpenOrders& ix) noexcept { r.u64(ix.owner).u64(ix.authority); }
void decode_fields(FieldReader& r, CloseOpenOrders& ix) noexcept { r.u64(ix.owner); }
void decode_fields(FieldReader& r, Prune& ix) noexcept { r.u64(ix.owner).u16(ix.limit); }
void decode_fields(FieldReader&, SweepFees&) noexcept {}
void decode_fields(FieldReader& r, MatchOrders& ix) noexcept { r.u16(ix.limit); }
void decode_fields(FieldReader& r, ConsumeEventsPermissioned& ix) noexcept { r.u16(ix.limit); }

template<typename T>
ErrorCode decode_as(ByteReader& reader, Instruction& out) noexcept {
    T instruction{};
    FieldReader fields(reader);
    decode_fields(fields, instruction);
    if (fields.failed() || !reader.at_end()) {
        return ErrorCode::INVALID_INSTRUCTION;
    }
    out = instruction;
    return ErrorCode::OK;
}

} // namespace

const char* instruction_name(InstructionTag tag) noexcept {
    switch (tag) {
        case InstructionTag::INIT_MARKET: return "InitMarket";
        case InstructionTag::NEW_ORDER: return "NewOrder";
        case InstructionTag::CANCEL_ORDER: return "CancelOrder";
        case InstructionTag::CONSUME_EVENTS: return "ConsumeEvents";
        case InstructionTag::SETTLE_FUNDS: return "SettleFunds";
        case InstructionTag::CANCEL_ORDER_BY_CLIENT_ID: return "CancelOrderByClientId";
        case InstructionTag::INIT_OPEN_ORDERS: return "InitOpenOrders";
        case InstructionTag::CLOSE_OPEN_ORDERS: return "CloseOpenOrders";
        case InstructionTag::PRUNE: return "Prune";
        case InstructionTag::SWEEP_FEES: return "SweepFees";
        case InstructionTag::MATCH_ORDERS: return "MatchOrders";
        case InstructionTag::CONSUME_EVENTS_PERMISSIONED: return "ConsumeEventsPermissioned";
    }
    return "Unknown";
}

size_t encode(const Instruction& instruction, uint8_t* buffer, size_t capacity) noexcept {
    ByteWriter writer(buffer, capacity);
    writer.put_uint8(static_cast<uint8_t>(instruction.index()));
    std::visit([&writer](const auto& ix) { encode_fields(writer, ix); }, instruction);
    return writer.ok() ? writer.encoded_length() : 0;
}

ErrorCode decode(const uint8_t* data, size_t length, Instruction& out) noexcept {
    ByteReader reader(data, length);
    const auto tag = reader.get_uint8();
    if (!tag) {
        return ErrorCode::INVALID_INSTRUCTION;
    }

    switch (static_cast<InstructionTag>(*tag)) {
        case InstructionTag::INIT_MARKET: return decode_as<InitMarket>(reader, out);
        case InstructionTag::NEW_ORDER: return decode_as<NewOrder>(reader, out);
        case InstructionTag::CANCEL_ORDER: return decode_as<CancelOrder>(reader, out);
        case InstructionTag::CONSUME_EVENTS: return decode_as<ConsumeEvents>(reader, out);
        case InstructionTag::SETTLE_FUNDS: return decode_as<SettleFunds>(reader, out);
        case InstructionTag::CANCEL_ORDER_BY_CLIENT_ID: return decode_as<CancelOrderByClientId>(reader, out);
        case InstructionTag::INIT_OPEN_ORDERS: return decode_as<InitOpenOrders>(reader, out);
        case InstructionTag::CLOSE_OPEN_ORDERS: return decode_as<CloseOpenOrders>(reader, out);
        case InstructionTag::PRUNE: return decode_as<Prune>(reader, out);
        case InstructionTag::SWEEP_FEES: return decode_as<SweepFees>(reader, out);
        case InstructionTag::MATCH_ORDERS: return decode_as<MatchOrders>(reader, out);
        case InstructionTag::CONSUME_EVENTS_PERMISSIONED:
            return decode_as<ConsumeEventsPermissioned>(reader, out);
    }
    return ErrorCode::INVALID_INSTRUCTION;
}

} // namespace strata::codec

/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "claim.hpp"

namespace xproof::interop {
    namespace {
        void validate_claimed(const chain_roots_t &claimed)
        {
            if (claimed.empty()) [[unlikely]]
                throw err_malformed_super_root_t("a claim must contain at least one chain");
            for (size_t i = 1; i < claimed.size(); ++i) {
                if (claimed[i - 1].chain_id >= claimed[i].chain_id) [[unlikely]]
                    throw err_malformed_super_root_t(fmt::format("claimed chain ids must be strictly ascending but got {} followed by {}",
                        claimed[i - 1].chain_id, claimed[i].chain_id));
            }
        }
    }

    claim_t claim_t::from_bytes(decoder &dec)
    {
        claim_t res {};
        dec.process(res.pre_hash);
        dec.process(res.post_hash);
        dec.process(res.timestamp);
        dec.process(res.claimed);
        switch (const auto dir = dec.uint_fixed<uint8_t>(1); dir) {
            case static_cast<uint8_t>(direction_t::asserts_valid):
            case static_cast<uint8_t>(direction_t::asserts_invalid):
                res.direction = static_cast<direction_t>(dir);
                break;
            [[unlikely]] default:
                throw err_malformed_super_root_t(fmt::format("unsupported claim direction: {}", dir));
        }
        validate_claimed(res.claimed);
        return res;
    }

    claim_t claim_t::decode(const buffer bytes)
    {
        try {
            return interop::from_bytes<claim_t>(bytes);
        } catch (const err_malformed_super_root_t &) {
            throw;
        } catch (const error &ex) {
            throw err_malformed_super_root_t("a malformed claim", ex);
        }
    }

    void claim_t::to_bytes(encoder &enc) const
    {
        validate_claimed(claimed);
        enc.process(pre_hash);
        enc.process(post_hash);
        enc.process(timestamp);
        enc.process(claimed);
        enc.uint_fixed(1, static_cast<uint8_t>(direction));
    }

    uint8_vector claim_t::encode() const
    {
        return interop::to_bytes(*this);
    }

    const output_root_t *claim_t::find(const chain_id_t chain_id) const noexcept
    {
        for (const auto &c: claimed) {
            if (c.chain_id == chain_id)
                return &c.root;
        }
        return nullptr;
    }
}

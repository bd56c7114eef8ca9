// ============================================================================
// ad_field.cpp — implementation for ad_field.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "blesniff/ad_field.hpp"

namespace blesniff {

const char* to_string(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::ok:              return "ok";
        case DecodeStatus::truncated_field: return "truncated_field";
        case DecodeStatus::short_packet:    return "short_packet";
        case DecodeStatus::not_advertising: return "not_advertising";
        case DecodeStatus::unsupported_pdu: return "unsupported_pdu";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// UTF-8 repair.
// Walks the input one code point at a time. A lead byte announces how many
// continuation bytes follow; the second byte has a narrower legal range for
// E0/ED/F0/F4 leads (rules out overlongs, surrogates and > U+10FFFF).
// On failure we emit U+FFFD for the bytes examined so far and restart at the
// first byte that broke the sequence.
// ---------------------------------------------------------------------------
static void append_replacement(std::string& out) {
    out += "\xEF\xBF\xBD";            // U+FFFD REPLACEMENT CHARACTER
}

std::string utf8_lossy(const uint8_t* p, size_t n) {
    std::string out;
    out.reserve(n);

    size_t i = 0;
    while (i < n) {
        const uint8_t c = p[i];

        if (c < 0x80) {                // ASCII fast path
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        size_t  need = 0;              // continuation bytes expected
        uint8_t lo = 0x80, hi = 0xBF;  // legal range for the second byte
        if      (c >= 0xC2 && c <= 0xDF) { need = 1; }
        else if (c == 0xE0)              { need = 2; lo = 0xA0; }
        else if (c >= 0xE1 && c <= 0xEC) { need = 2; }
        else if (c == 0xED)              { need = 2; hi = 0x9F; }
        else if (c >= 0xEE && c <= 0xEF) { need = 2; }
        else if (c == 0xF0)              { need = 3; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) { need = 3; }
        else if (c == 0xF4)              { need = 3; hi = 0x8F; }
        else {
            append_replacement(out);   // stray continuation or invalid lead
            ++i;
            continue;
        }

        size_t j = i + 1;
        bool ok = true;
        for (size_t k = 0; k < need; ++k, ++j) {
            if (j >= n) { ok = false; break; }
            const uint8_t cc = p[j];
            const uint8_t klo = (k == 0) ? lo : 0x80;
            const uint8_t khi = (k == 0) ? hi : 0xBF;
            if (cc < klo || cc > khi) { ok = false; break; }
        }

        if (ok) {
            out.append(reinterpret_cast<const char*>(p + i), need + 1);
            i += need + 1;
        } else {
            append_replacement(out);
            i = j;                     // resume at the offending byte
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// split_ad_field()
// Bounds check only. The length byte counts type + value, so an element
// occupies 1 + length bytes in the payload.
// ---------------------------------------------------------------------------
DecodeStatus split_ad_field(const uint8_t* p, size_t n, AdvertisingField& out, size_t& consumed) {
    out = AdvertisingField{};
    if (n == 0) return DecodeStatus::truncated_field;

    const uint8_t len = p[0];
    if (len == 0) {                    // end-of-data padding
        consumed = 1;
        return DecodeStatus::ok;
    }
    if (size_t(len) + 1 > n)           // declared element runs past the slice
        return DecodeStatus::truncated_field;

    out.length    = len;
    out.ad_type   = p[1];
    out.value_len = size_t(len) - 1;
    out.value     = out.value_len ? p + 2 : nullptr;
    consumed      = size_t(len) + 1;
    return DecodeStatus::ok;
}

// Fill an opaque fallback from the element view.
static void as_opaque(const AdvertisingField& f, DecodedField& out) {
    out.kind = FieldKind::opaque;
    out.raw.type = f.ad_type;
    out.raw.value.assign(f.value, f.value + f.value_len);
}

DecodeStatus decode_ad_field(const uint8_t* p, size_t n, DecodedField& out, size_t& consumed) {
    out = DecodedField{};

    AdvertisingField f;
    const DecodeStatus st = split_ad_field(p, n, f, consumed);
    if (st != DecodeStatus::ok) return st;

    if (f.length == 0) {
        out.kind = FieldKind::end_of_data;
        return DecodeStatus::ok;
    }

    out.ad_type = f.ad_type;

    switch (f.ad_type) {
        case AD_FLAGS:
            if (f.value_len < 1) { as_opaque(f, out); break; }
            out.kind  = FieldKind::flags;
            out.flags = f.value[0];
            break;

        case AD_TX_POWER_LEVEL:
            if (f.value_len < 1) { as_opaque(f, out); break; }
            out.kind     = FieldKind::tx_power;
            out.tx_power = static_cast<int8_t>(f.value[0]);
            break;

        case AD_COMPLETE_LOCAL_NAME:
            out.kind       = FieldKind::local_name;
            out.local_name = utf8_lossy(f.value, f.value_len);
            break;

        case AD_MANUFACTURER_DATA:
            if (f.value_len < 2) { as_opaque(f, out); break; }
            out.kind = FieldKind::manufacturer;
            out.manufacturer.company_id =
                static_cast<uint16_t>(f.value[0] | (uint16_t(f.value[1]) << 8));  // little endian
            out.manufacturer.data.assign(f.value + 2, f.value + f.value_len);
            break;

        default:
            as_opaque(f, out);
            break;
    }
    return DecodeStatus::ok;
}

} // namespace blesniff

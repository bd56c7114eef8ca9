// ============================================================================
// advertising.cpp — implementation for advertising.hpp
// ============================================================================

#include "blesniff/advertising.hpp"

namespace blesniff {

void apply_field(const DecodedField& f, BlePacket& pkt) {
    switch (f.kind) {
        case FieldKind::flags:
            pkt.flags = f.flags;                      // last seen wins
            break;
        case FieldKind::tx_power:
            pkt.tx_power = f.tx_power;                // last seen wins
            break;
        case FieldKind::local_name:
            pkt.local_name = f.local_name;            // last seen wins
            break;
        case FieldKind::manufacturer:
            if (pkt.manufacturers.empty()) {          // first occurrence feeds the shortcuts
                pkt.manufacturer_id   = f.manufacturer.company_id;
                pkt.manufacturer_data = f.manufacturer.data;
            }
            pkt.manufacturers.push_back(f.manufacturer);
            break;
        case FieldKind::opaque:
            pkt.raw_fields.push_back(f.raw);
            break;
        case FieldKind::end_of_data:
            return;                                   // not an element; nothing to record
    }
    pkt.ad_types.push_back(f.ad_type);
}

AdScanResult decode_advertising_data(const uint8_t* p, size_t n, BlePacket& pkt) {
    AdScanResult r;

    size_t off = 0;                                   // cursor into the payload
    while (off < n) {
        DecodedField f;
        size_t used = 0;

        r.status = decode_ad_field(p + off, n - off, f, used);
        if (r.status != DecodeStatus::ok)
            break;                                    // truncated: keep what we have

        off += used;
        if (f.kind == FieldKind::end_of_data) {
            r.end_marker = true;
            break;
        }

        apply_field(f, pkt);
        ++r.elements;
    }

    r.consumed = off;
    return r;
}

} // namespace blesniff

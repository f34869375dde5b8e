#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "raw_record.hpp"
#include <zerialize/zerialize.hpp>
#include <zerialize/protocols/msgpack.hpp>
#include <zerialize/protocols/cbor.hpp>
#include <zerialize/protocols/flex.hpp>
#include <zerialize/protocols/zera.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace parkwatch {

// Which raw_record field a feed key populates. The feed has used several
// spellings over time; all of them are accepted.
enum class record_field {
    id,
    latitude,
    longitude,
    location,
    street,
    status,
    zone,
    last_updated,
    ignored
};

record_field classify_key(std::string_view key);

// Lenient numeric parse used for coordinates sent as strings.
std::optional<double> parse_double(std::string_view s);

namespace detail {

template <typename Value>
std::optional<double> read_number(Value& value) {
    if (value.isFloat()) return value.asDouble();
    if (value.isInt() || value.isUInt()) return static_cast<double>(value.asInt64());
    if (value.isString()) return parse_double(value.asStringView());
    return std::nullopt;
}

template <typename Value>
std::optional<std::string> read_text(Value& value) {
    if (value.isString()) return std::string(value.asStringView());
    if (value.isInt() || value.isUInt()) return std::to_string(value.asInt64());
    return std::nullopt;
}

template <typename Value>
std::optional<timestamp> read_time(Value& value) {
    if (value.isInt() || value.isUInt()) return checked_epoch_seconds(value.asInt64());
    if (value.isFloat()) return checked_epoch_seconds(value.asDouble());
    if (value.isString()) return parse_iso8601(value.asStringView());
    return std::nullopt;
}

template <typename Value>
void read_location(raw_record& rec, Value& value) {
    if (!value.isMap()) return;
    for (auto key_sv : value.mapKeys()) {
        auto field = classify_key(key_sv);
        auto inner = value[key_sv];
        if (field == record_field::latitude)  rec.latitude  = read_number(inner);
        if (field == record_field::longitude) rec.longitude = read_number(inner);
    }
}

} // namespace detail

// Populate a raw_record from one zerialize map value.
template <typename Value>
raw_record read_record(Value& value, const std::shared_ptr<spdlog::logger>& log) {
    raw_record rec;
    if (!value.isMap()) {
        rec.malformed = true;
        return rec;
    }

    for (auto key_sv : value.mapKeys()) {
        auto field = classify_key(key_sv);
        if (field == record_field::ignored) continue;

        auto v = value[key_sv];
        try {
            switch (field) {
                case record_field::id: {
                    auto text = detail::read_text(v);
                    if (text && !text->empty()) rec.id = std::move(*text);
                    break;
                }
                case record_field::latitude:
                    rec.latitude = detail::read_number(v);
                    break;
                case record_field::longitude:
                    rec.longitude = detail::read_number(v);
                    break;
                case record_field::location:
                    detail::read_location(rec, v);
                    break;
                case record_field::street:
                    if (auto text = detail::read_text(v)) rec.street = std::move(*text);
                    break;
                case record_field::status:
                    if (auto text = detail::read_text(v)) rec.status = std::move(*text);
                    break;
                case record_field::zone:
                    if (auto text = detail::read_text(v)) rec.zone = std::move(*text);
                    break;
                case record_field::last_updated:
                    if (auto t = detail::read_time(v)) rec.last_updated = *t;
                    break;
                case record_field::ignored:
                    break;
            }
        } catch (const std::exception& e) {
            if (log) log->debug("record_decoder: failed to extract field '{}': {}", key_sv, e.what());
        }
    }

    return rec;
}

// Read a whole batch: either an array of records, or a map carrying
// "records" plus optional "streets" and "captured_at".
// Throws ingest_error when the root has neither shape.
template <typename Reader>
raw_batch read_batch(Reader& root, const std::shared_ptr<spdlog::logger>& log) {
    raw_batch batch;

    auto read_records = [&](auto& arr) {
        auto sz = arr.arraySize();
        batch.records.reserve(sz);
        for (std::size_t i = 0; i < sz; ++i) {
            auto elem = arr[i];
            batch.records.push_back(read_record(elem, log));
        }
    };

    if (root.isArray()) {
        read_records(root);
        return batch;
    }

    if (!root.isMap()) {
        throw ingest_error("payload root is neither an array nor a map");
    }

    bool has_records = false;
    for (auto key_sv : root.mapKeys()) {
        auto v = root[key_sv];
        if (key_sv == "records") {
            if (!v.isArray()) throw ingest_error("'records' is not an array");
            read_records(v);
            has_records = true;
        } else if (key_sv == "streets") {
            if (!v.isArray()) throw ingest_error("'streets' is not an array");
            auto sz = v.arraySize();
            for (std::size_t i = 0; i < sz; ++i) {
                auto elem = v[i];
                if (elem.isString()) batch.streets.emplace_back(elem.asStringView());
            }
        } else if (key_sv == "captured_at") {
            batch.captured_at = detail::read_time(v);
        }
    }

    if (!has_records) throw ingest_error("payload map has no 'records' array");
    return batch;
}

// Top-level entry: decode raw bytes according to format.
// Throws ingest_error if the payload cannot be decoded into a batch.
raw_batch decode_payload(
    payload_format format,
    std::span<const char> payload,
    const std::shared_ptr<spdlog::logger>& log);

} // namespace parkwatch

#include "record_decoder.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace parkwatch {

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// JSON values go through nlohmann directly; the field rules mirror the
// zerialize readers in the header.
std::optional<double> json_number(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return parse_double(v.get_ref<const std::string&>());
    return std::nullopt;
}

std::optional<std::string> json_text(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<std::int64_t>());
    return std::nullopt;
}

std::optional<timestamp> json_time(const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
        return checked_epoch_seconds(static_cast<std::int64_t>(u));
    }
    if (v.is_number_integer()) return checked_epoch_seconds(v.get<std::int64_t>());
    if (v.is_number_float()) return checked_epoch_seconds(v.get<double>());
    if (v.is_string()) return parse_iso8601(v.get_ref<const std::string&>());
    return std::nullopt;
}

raw_record json_record(const nlohmann::json& obj) {
    raw_record rec;
    if (!obj.is_object()) {
        rec.malformed = true;
        return rec;
    }

    for (const auto& [key, v] : obj.items()) {
        switch (classify_key(key)) {
            case record_field::id:
                if (auto text = json_text(v); text && !text->empty()) rec.id = std::move(*text);
                break;
            case record_field::latitude:
                rec.latitude = json_number(v);
                break;
            case record_field::longitude:
                rec.longitude = json_number(v);
                break;
            case record_field::location:
                if (v.is_object()) {
                    for (const auto& [inner_key, inner] : v.items()) {
                        auto f = classify_key(inner_key);
                        if (f == record_field::latitude)  rec.latitude  = json_number(inner);
                        if (f == record_field::longitude) rec.longitude = json_number(inner);
                    }
                }
                break;
            case record_field::street:
                if (auto text = json_text(v)) rec.street = std::move(*text);
                break;
            case record_field::status:
                if (auto text = json_text(v)) rec.status = std::move(*text);
                break;
            case record_field::zone:
                if (auto text = json_text(v)) rec.zone = std::move(*text);
                break;
            case record_field::last_updated:
                if (auto t = json_time(v)) rec.last_updated = *t;
                break;
            case record_field::ignored:
                break;
        }
    }
    return rec;
}

raw_batch json_batch(const nlohmann::json& root) {
    raw_batch batch;

    const nlohmann::json* records = nullptr;
    if (root.is_array()) {
        records = &root;
    } else if (root.is_object()) {
        auto it = root.find("records");
        if (it == root.end() || !it->is_array()) {
            throw ingest_error("payload map has no 'records' array");
        }
        records = &*it;

        if (auto s = root.find("streets"); s != root.end()) {
            if (!s->is_array()) throw ingest_error("'streets' is not an array");
            for (const auto& name : *s) {
                if (name.is_string()) batch.streets.push_back(name.get<std::string>());
            }
        }
        if (auto c = root.find("captured_at"); c != root.end()) {
            batch.captured_at = json_time(*c);
        }
    } else {
        throw ingest_error("payload root is neither an array nor a map");
    }

    batch.records.reserve(records->size());
    for (const auto& obj : *records) {
        batch.records.push_back(json_record(obj));
    }
    return batch;
}

} // anonymous namespace

record_field classify_key(std::string_view key) {
    auto k = lowercase(key);
    if (k == "kerbside_id" || k == "kerbsideid" || k == "id" || k == "bay_id") return record_field::id;
    if (k == "latitude" || k == "lat")                                      return record_field::latitude;
    if (k == "longitude" || k == "lng" || k == "lon")                       return record_field::longitude;
    if (k == "location")                                                    return record_field::location;
    if (k == "street" || k == "street_name" || k == "road_segment_description") return record_field::street;
    if (k == "status" || k == "status_description")                         return record_field::status;
    if (k == "zone" || k == "zone_number")                                  return record_field::zone;
    if (k == "last_updated" || k == "lastupdated" || k == "status_timestamp") return record_field::last_updated;
    return record_field::ignored;
}

std::optional<double> parse_double(std::string_view s) {
    std::string text(s);
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str()) return std::nullopt;
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) ++end;
    if (*end != '\0') return std::nullopt;
    return v;
}

raw_batch decode_payload(
    payload_format format,
    std::span<const char> payload,
    const std::shared_ptr<spdlog::logger>& log)
{
    if (payload.empty()) throw ingest_error("empty payload");

    try {
        auto bytes = std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(payload.data()), payload.size());

        switch (format) {
            case payload_format::msgpack: {
                zerialize::MsgPack::Deserializer reader(bytes);
                return read_batch(reader, log);
            }
            case payload_format::cbor: {
                zerialize::CBOR::Deserializer reader(bytes);
                return read_batch(reader, log);
            }
            case payload_format::flexbuffers: {
                zerialize::Flex::Deserializer reader(bytes);
                return read_batch(reader, log);
            }
            case payload_format::zera: {
                zerialize::Zera::Deserializer reader(bytes);
                return read_batch(reader, log);
            }
            case payload_format::json: {
                return json_batch(nlohmann::json::parse(payload.begin(), payload.end()));
            }
        }
    } catch (const ingest_error&) {
        throw;
    } catch (const std::exception& e) {
        throw ingest_error(std::string("failed to decode ") + to_string(format) +
                           " payload: " + e.what());
    }

    throw ingest_error("unsupported payload format");
}

} // namespace parkwatch

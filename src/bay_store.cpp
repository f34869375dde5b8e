#include "bay_store.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace parkwatch {

static std::string trimmed(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

normalized_batch normalize_batch(raw_batch batch,
                                 timestamp now,
                                 ingest_report& report,
                                 const std::shared_ptr<spdlog::logger>& log) {
    normalized_batch out;
    out.captured_at = batch.captured_at.value_or(now);

    report.received += batch.records.size();

    // id -> offset in out.bays
    std::unordered_map<std::string, std::size_t> seen;
    seen.reserve(batch.records.size());
    out.bays.reserve(batch.records.size());

    for (std::size_t i = 0; i < batch.records.size(); ++i) {
        auto& rec = batch.records[i];

        if (rec.malformed) {
            ++report.malformed;
            if (log) log->debug("bay_store: record {} is not a map", i);
            continue;
        }

        std::string id = rec.id ? trimmed(std::move(*rec.id)) : std::string();
        if (id.empty()) {
            ++report.missing_id;
            if (log) log->debug("bay_store: record {} has no id", i);
            continue;
        }

        if (!rec.latitude || !rec.longitude ||
            !is_valid_coordinate(coordinate{*rec.latitude, *rec.longitude})) {
            ++report.invalid_coordinate;
            if (log) log->debug("bay_store: bay '{}' has no usable coordinate", id);
            continue;
        }

        bay b;
        b.id = std::move(id);
        b.position = coordinate{*rec.latitude, *rec.longitude};
        b.street = trimmed(std::move(rec.street));
        b.state = parse_occupancy(rec.status);
        b.last_updated = rec.last_updated;
        b.zone = trimmed(std::move(rec.zone));

        auto [it, inserted] = seen.try_emplace(b.id, out.bays.size());
        if (!inserted) {
            ++report.duplicate_id;
            auto& existing = out.bays[it->second];
            if (log) log->debug("bay_store: duplicate bay id '{}'", b.id);
            if (b.last_updated > existing.last_updated) existing = std::move(b);
            continue;
        }
        out.bays.push_back(std::move(b));
    }

    out.streets.reserve(batch.streets.size());
    for (auto& s : batch.streets) {
        auto name = trimmed(std::move(s));
        if (!name.empty()) out.streets.push_back(std::move(name));
    }
    std::sort(out.streets.begin(), out.streets.end());
    out.streets.erase(std::unique(out.streets.begin(), out.streets.end()), out.streets.end());

    return out;
}

} // namespace parkwatch

#include "payload_file.hpp"
#include "json_codec.hpp"
#include "parking_engine.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace parkwatch {

std::vector<char> read_payload_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("cannot open file: " + path);
    }

    auto size = file.tellg();
    file.seekg(0);
    std::vector<char> buf(static_cast<size_t>(size));
    file.read(buf.data(), size);

    if (!file) {
        throw std::runtime_error("failed to read file: " + path);
    }
    return buf;
}

std::optional<payload_format> format_for_path(const std::string& path) {
    auto ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json")                     return payload_format::json;
    if (ext == ".msgpack" || ext == ".mpk") return payload_format::msgpack;
    if (ext == ".cbor")                     return payload_format::cbor;
    if (ext == ".flex")                     return payload_format::flexbuffers;
    if (ext == ".zera")                     return payload_format::zera;
    return std::nullopt;
}

void inspect_payload(const std::string& path, payload_format format,
                     const engine_options& options,
                     std::shared_ptr<spdlog::logger> log) {
    auto buf = read_payload_file(path);

    parking_engine engine(options, std::move(log));
    auto result = engine.trigger_refresh(format, buf);

    nlohmann::json out = {
        {"file", path},
        {"format", to_string(format)},
        {"ingest", encode(result)},
        {"overview", encode(engine.get_overview_stats())},
        {"streets", engine.current()->aggregates.streets.size()},
        {"index_cells", engine.current()->index.cell_count()}
    };
    std::cout << dump_reply(out, 2) << "\n";
}

} // namespace parkwatch

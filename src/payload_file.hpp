#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parkwatch {

// Read an entire payload file into memory.
// Throws std::runtime_error on file I/O errors.
std::vector<char> read_payload_file(const std::string& path);

// Payload format implied by a file extension (.json, .msgpack/.mpk, .cbor,
// .flex, .zera), case-insensitive. nullopt for anything else.
std::optional<payload_format> format_for_path(const std::string& path);

// Decode a payload file, run it through validation and indexing against the
// configured region, and print the ingest report and overview as JSON to
// stdout. Throws on I/O errors and ingest_error.
void inspect_payload(const std::string& path, payload_format format,
                     const engine_options& options,
                     std::shared_ptr<spdlog::logger> log);

} // namespace parkwatch

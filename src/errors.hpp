#pragma once

#include <stdexcept>
#include <string>

namespace parkwatch {

// Base for every error raised by the engine core.
class engine_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A bay or query location lies outside the configured region or is not finite.
class invalid_coordinate : public engine_error {
public:
    using engine_error::engine_error;
};

// Query parameters rejected before any work is done.
class invalid_query : public engine_error {
public:
    using engine_error::engine_error;
};

// Refresh input could not be decoded into records at all.
class ingest_error : public engine_error {
public:
    using engine_error::engine_error;
};

// Outcome carried on query result envelopes. Truncation is a separate flag
// because a truncated result is still a successful one.
enum class query_status {
    ok,
    invalid_query,
    timeout
};

const char* to_string(query_status s);

} // namespace parkwatch

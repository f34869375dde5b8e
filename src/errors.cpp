#include "errors.hpp"

namespace parkwatch {

const char* to_string(query_status s) {
    switch (s) {
        case query_status::ok:            return "ok";
        case query_status::invalid_query: return "invalid_query";
        case query_status::timeout:       return "timeout";
    }
    return "unknown";
}

} // namespace parkwatch

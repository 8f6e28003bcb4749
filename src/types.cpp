#include <pid_image/types.hpp>

namespace pid_image {

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                return "none";
        case decode_error::invalid_format:      return "invalid_format";
        case decode_error::out_of_bounds:       return "out_of_bounds";
        case decode_error::palette_absent:      return "palette_absent";
        case decode_error::dimensions_exceeded: return "dimensions_exceeded";
        case decode_error::io_error:            return "io_error";
        case decode_error::internal_error:      return "internal_error";
    }
    return "unknown";
}

} // namespace pid_image

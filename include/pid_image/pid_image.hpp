#ifndef PID_IMAGE_PID_IMAGE_HPP_
#define PID_IMAGE_PID_IMAGE_HPP_

#include <pid_image/pid_image_export.h>
#include <pid_image/types.hpp>
#include <pid_image/source.hpp>
#include <pid_image/surface.hpp>
#include <pid_image/encoder.hpp>
#include <pid_image/palettes.hpp>
#include <pid_image/codecs/pid.hpp>
#include <pid_image/codecs/png.hpp>
#include <pid_image/codecs/tga.hpp>
#include <pid_image/codecs/bmp.hpp>

namespace pid_image {

// All public API is included via the headers above.
// See:
//   - types.hpp:      decode_error, decode_result, decode_options
//   - source.hpp:     byte_source, span_source, host_source, byte_cursor
//   - surface.hpp:    surface interface, memory_surface, canvas_surface
//   - encoder.hpp:    encoder, encoder_registry, save_image()
//   - palettes.hpp:   fallback palettes for PID files without a color table
//   - codecs/pid.hpp: PID header, flags, decompressors, color resolution
//   - codecs/*.hpp:   PNG, TGA and BMP output encoders

} // namespace pid_image

#endif // PID_IMAGE_PID_IMAGE_HPP_

/**
 * ByteBeam - Randomness and secret comparison built on libsodium.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bytebeam::crypto
{

    void ensure_sodium_init();

    // Uniform value in [0, upper_bound); upper_bound must be non-zero.
    std::uint32_t random_below(std::uint32_t upper_bound);

    // Random RFC 4122 version 4 UUID in canonical lowercase form.
    std::string random_uuid();

    // Constant-time for equal-length inputs.
    bool secrets_equal(std::string_view presented, std::string_view expected);

} // namespace bytebeam::crypto

#pragma once
#include <cinttypes>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "advisory.hpp"
#include "common.hpp"
#include "eheader.hpp"

namespace eglib {
    // Decoded section bytes of a binary manifest.
    struct Payload {
        std::vector<char> data = {};
        std::string sha1_hash = {};
        bool complete = {};
        bool verified = {};

        // Inflates or copies the stored payload of an unencrypted container and checks its
        // digest. Shortfalls and digest mismatches are recorded, never thrown.
        static auto read(ManifestHeader const& header, std::span<char const> stored, Advisories& advisories)
            -> Payload;
    };

    // Inflates a zlib stream into at most size bytes. A damaged or short stream yields the
    // bytes decoded before the damage.
    extern auto zlib_inflate(std::span<char const> src, std::size_t size) -> std::vector<char>;

    extern auto sha1_hex(std::span<char const> src) -> std::string;
}

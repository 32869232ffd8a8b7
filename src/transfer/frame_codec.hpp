#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "manifest.hpp"

// Frame wire format, one per transferred file:
//
//   [u32 BE header length][header][payload][u32 BE footer length][footer]
//
// Header and footer are YAML flow mappings, e.g.
//   {path: "docs/a.txt", size: 5000, mtime: 1718000000, compressed: true}
//   {crc32: 3632233996, sha256: "9f86d0..."}
//
// Uncompressed payload: the source bytes verbatim.
// Compressed payload: a sequence of chunk records, one per source chunk,
//   [u32 BE record length][zlib stream of that chunk]
// Each chunk is deflated on its own, so records are independent; the decoder
// inflates record by record until `size` bytes have been produced.
//
// Footer checksums cover the uncompressed bytes read from the source.

struct FrameHeader {
    std::string path;
    uint64_t size = 0;
    uint64_t mtime = 0;
    bool compressed = false;
};

struct FrameFooter {
    uint32_t crc32 = 0;
    Digest256 sha256{};
};

struct EncodeOptions {
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    int compression_level = DEFAULT_COMPRESSION_LEVEL;
};

struct EncodeStats {
    uint64_t source_bytes = 0;    // uncompressed bytes read
    uint64_t payload_bytes = 0;   // payload bytes written (after compression)
    uint64_t frame_bytes = 0;     // everything written, prefixes included
    FrameFooter footer;
};

struct FrameInfo {
    FrameHeader header;
    FrameFooter footer;
    uint64_t payload_bytes = 0;
};

// Header/footer records
std::string serialize_header(const FrameHeader& header);
std::string serialize_footer(const FrameFooter& footer);
FrameHeader parse_header(const std::string& text);   // throws FrameError
FrameFooter parse_footer(const std::string& text);   // throws FrameError

FrameHeader header_for_entry(const ManifestEntry& entry, bool allow_compression);

// Stream `src` into `out` as one frame. `progress` receives the running count
// of payload bytes written, once per chunk.
// Throws std::runtime_error on read or write failure.
EncodeStats encode_frame(std::istream& src, std::ostream& out,
                         const FrameHeader& header,
                         const EncodeOptions& options = EncodeOptions{},
                         const ByteProgress& progress = nullptr);

// Decode one frame from `frame`, writing the original bytes to `out`.
// Throws FrameError if the header or footer is malformed, IntegrityError if
// the payload is damaged or does not match the footer checksums.
FrameHeader decode_frame(std::istream& frame, std::ostream& out,
                         const ByteProgress& progress = nullptr);

// Read header and footer without materializing the payload.
// Checksums are not verified. Throws FrameError.
FrameInfo inspect_frame(std::istream& frame);

#include "frame_codec.hpp"
#include "checksum.hpp"
#include <core/errors.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <zlib.h>
#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <stdexcept>
#include <vector>

// ── Length prefixes ────────────────────────────────────────

static void write_u32_be(std::ostream& out, uint32_t v) {
    char b[4] = {
        static_cast<char>((v >> 24) & 0xFF),
        static_cast<char>((v >> 16) & 0xFF),
        static_cast<char>((v >> 8) & 0xFF),
        static_cast<char>(v & 0xFF),
    };
    out.write(b, 4);
}

static bool read_u32_be(std::istream& in, uint32_t& v) {
    unsigned char b[4];
    in.read(reinterpret_cast<char*>(b), 4);
    if (in.gcount() != 4) return false;
    v = (static_cast<uint32_t>(b[0]) << 24) | (static_cast<uint32_t>(b[1]) << 16) |
        (static_cast<uint32_t>(b[2]) << 8) | static_cast<uint32_t>(b[3]);
    return true;
}

static void write_checked(std::ostream& out, const char* data, size_t len) {
    out.write(data, static_cast<std::streamsize>(len));
    if (!out) {
        throw std::runtime_error("write to destination failed");
    }
}

// Read a length-prefixed header/footer record.
static std::string read_record(std::istream& in, const char* what) {
    uint32_t len = 0;
    if (!read_u32_be(in, len)) {
        throw FrameError(fmt::format("truncated frame: missing {} length", what));
    }
    if (len == 0 || len > MAX_FRAME_RECORD_SIZE) {
        throw FrameError(fmt::format("invalid {} length {}", what, len));
    }
    std::string text(len, '\0');
    in.read(&text[0], len);
    if (static_cast<uint32_t>(in.gcount()) != len) {
        throw FrameError(fmt::format("truncated frame: {} shorter than {} bytes", what, len));
    }
    return text;
}

// ── Records ────────────────────────────────────────────────

std::string serialize_header(const FrameHeader& header) {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "path" << YAML::Value << YAML::DoubleQuoted << header.path;
    out << YAML::Key << "size" << YAML::Value << header.size;
    out << YAML::Key << "mtime" << YAML::Value << header.mtime;
    out << YAML::Key << "compressed" << YAML::Value << header.compressed;
    out << YAML::EndMap;
    if (!out.good()) {
        throw std::runtime_error("header serialization failed: " + out.GetLastError());
    }
    return std::string(out.c_str(), out.size());
}

std::string serialize_footer(const FrameFooter& footer) {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "crc32" << YAML::Value << footer.crc32;
    out << YAML::Key << "sha256" << YAML::Value << YAML::DoubleQuoted << digest_to_hex(footer.sha256);
    out << YAML::EndMap;
    if (!out.good()) {
        throw std::runtime_error("footer serialization failed: " + out.GetLastError());
    }
    return std::string(out.c_str(), out.size());
}

static YAML::Node load_record(const std::string& text, const char* what,
                              std::initializer_list<const char*> required) {
    YAML::Node node;
    try {
        node = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw FrameError(fmt::format("unparsable {}: {}", what, e.what()));
    }
    if (!node.IsMap()) {
        throw FrameError(fmt::format("{} is not a mapping", what));
    }
    for (const char* key : required) {
        if (!node[key] || !node[key].IsScalar()) {
            throw FrameError(fmt::format("{} missing field '{}'", what, key));
        }
    }
    return node;
}

FrameHeader parse_header(const std::string& text) {
    YAML::Node node = load_record(text, "header", {"path", "size", "mtime", "compressed"});
    try {
        FrameHeader header;
        header.path = node["path"].as<std::string>();
        header.size = node["size"].as<uint64_t>();
        header.mtime = node["mtime"].as<uint64_t>();
        header.compressed = node["compressed"].as<bool>();
        return header;
    } catch (const YAML::Exception& e) {
        throw FrameError(std::string("bad header field: ") + e.what());
    }
}

FrameFooter parse_footer(const std::string& text) {
    YAML::Node node = load_record(text, "footer", {"crc32", "sha256"});
    FrameFooter footer;
    try {
        footer.crc32 = node["crc32"].as<uint32_t>();
    } catch (const YAML::Exception& e) {
        throw FrameError(std::string("bad footer crc32: ") + e.what());
    }
    if (!digest_from_hex(node["sha256"].as<std::string>(), footer.sha256)) {
        throw FrameError("bad footer sha256");
    }
    return footer;
}

FrameHeader header_for_entry(const ManifestEntry& entry, bool allow_compression) {
    FrameHeader header;
    header.path = entry.relative_path;
    header.size = entry.size;
    header.mtime = entry.modified_at;
    header.compressed = allow_compression && entry.compressible;
    return header;
}

// ── Encode ─────────────────────────────────────────────────

// Deflate one chunk as a standalone zlib stream.
static std::vector<Bytef> deflate_chunk(const char* data, size_t len, int level) {
    uLongf bound = compressBound(static_cast<uLong>(len));
    std::vector<Bytef> out(bound);
    int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef*>(data),
                       static_cast<uLong>(len), level);
    if (rc != Z_OK) {
        throw std::runtime_error(fmt::format("deflate failed (zlib error {})", rc));
    }
    out.resize(bound);
    return out;
}

EncodeStats encode_frame(std::istream& src, std::ostream& out,
                         const FrameHeader& header,
                         const EncodeOptions& options,
                         const ByteProgress& progress) {
    EncodeStats stats;

    std::string header_bytes = serialize_header(header);
    write_u32_be(out, static_cast<uint32_t>(header_bytes.size()));
    write_checked(out, header_bytes.data(), header_bytes.size());
    stats.frame_bytes += 4 + header_bytes.size();

    Crc32Accumulator crc;
    Sha256Accumulator sha;
    std::vector<char> buffer(std::max<size_t>(options.chunk_size, 1));

    while (true) {
        src.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        size_t n = static_cast<size_t>(src.gcount());
        if (src.bad()) {
            throw std::runtime_error("read from source failed");
        }
        if (n == 0) break;

        crc.update(buffer.data(), n);
        sha.update(buffer.data(), n);
        stats.source_bytes += n;

        if (header.compressed) {
            auto record = deflate_chunk(buffer.data(), n, options.compression_level);
            write_u32_be(out, static_cast<uint32_t>(record.size()));
            write_checked(out, reinterpret_cast<const char*>(record.data()), record.size());
            stats.payload_bytes += 4 + record.size();
        } else {
            write_checked(out, buffer.data(), n);
            stats.payload_bytes += n;
        }

        if (progress) progress(stats.payload_bytes);
        if (src.eof()) break;
    }

    stats.frame_bytes += stats.payload_bytes;

    stats.footer.crc32 = crc.value();
    stats.footer.sha256 = sha.finish();
    std::string footer_bytes = serialize_footer(stats.footer);
    write_u32_be(out, static_cast<uint32_t>(footer_bytes.size()));
    write_checked(out, footer_bytes.data(), footer_bytes.size());
    stats.frame_bytes += 4 + footer_bytes.size();

    out.flush();
    if (!out) {
        throw std::runtime_error("flush to destination failed");
    }
    return stats;
}

// ── Decode ─────────────────────────────────────────────────

namespace {

// Owns a zlib inflate stream for one chunk record.
struct InflateStream {
    z_stream zs;

    InflateStream() {
        std::memset(&zs, 0, sizeof(zs));
        if (inflateInit(&zs) != Z_OK) {
            throw std::runtime_error("inflateInit failed");
        }
    }
    ~InflateStream() { inflateEnd(&zs); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
};

// Sink for decoded payload bytes: checksums, output, running count.
struct PayloadSink {
    std::ostream& out;
    const ByteProgress& progress;
    Crc32Accumulator crc;
    Sha256Accumulator sha;
    uint64_t produced = 0;
    uint64_t expected;

    PayloadSink(std::ostream& o, const ByteProgress& p, uint64_t size)
        : out(o), progress(p), expected(size) {}

    void consume(const char* data, size_t n) {
        if (produced + n > expected) {
            throw IntegrityError(fmt::format(
                "payload larger than declared size {}", expected));
        }
        crc.update(data, n);
        sha.update(data, n);
        out.write(data, static_cast<std::streamsize>(n));
        if (!out) {
            throw std::runtime_error("write of decoded payload failed");
        }
        produced += n;
    }
};

constexpr size_t DECODE_BUF_SIZE = 64 * 1024;

void decode_plain_payload(std::istream& frame, PayloadSink& sink) {
    std::vector<char> buf(DECODE_BUF_SIZE);
    while (sink.produced < sink.expected) {
        size_t want = static_cast<size_t>(
            std::min<uint64_t>(buf.size(), sink.expected - sink.produced));
        frame.read(buf.data(), static_cast<std::streamsize>(want));
        size_t n = static_cast<size_t>(frame.gcount());
        if (n == 0) {
            throw IntegrityError(fmt::format(
                "payload truncated at {} of {} bytes", sink.produced, sink.expected));
        }
        sink.consume(buf.data(), n);
        if (sink.progress) sink.progress(sink.produced);
    }
}

// Inflate one [u32 length][zlib stream] record.
void decode_chunk_record(std::istream& frame, PayloadSink& sink,
                         std::vector<char>& in_buf, std::vector<char>& out_buf) {
    uint32_t record_len = 0;
    if (!read_u32_be(frame, record_len)) {
        throw IntegrityError(fmt::format(
            "payload truncated at {} of {} bytes", sink.produced, sink.expected));
    }
    if (record_len == 0) {
        throw IntegrityError("empty compressed chunk record");
    }

    InflateStream inflater;
    uint64_t remaining = record_len;
    bool stream_end = false;

    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(in_buf.size(), remaining));
        frame.read(in_buf.data(), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(frame.gcount());
        if (got == 0) {
            throw IntegrityError("compressed chunk record truncated");
        }
        remaining -= got;

        inflater.zs.next_in = reinterpret_cast<Bytef*>(in_buf.data());
        inflater.zs.avail_in = static_cast<uInt>(got);

        do {
            inflater.zs.next_out = reinterpret_cast<Bytef*>(out_buf.data());
            inflater.zs.avail_out = static_cast<uInt>(out_buf.size());
            int rc = inflate(&inflater.zs, Z_NO_FLUSH);
            if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
                throw IntegrityError(fmt::format(
                    "compressed chunk corrupt (zlib error {})", rc));
            }
            size_t produced = out_buf.size() - inflater.zs.avail_out;
            if (produced > 0) sink.consume(out_buf.data(), produced);
            if (rc == Z_STREAM_END) {
                stream_end = true;
                break;
            }
            if (rc == Z_BUF_ERROR && produced == 0) break;  // needs more input
        } while (inflater.zs.avail_in > 0 || inflater.zs.avail_out == 0);

        if (stream_end && (inflater.zs.avail_in > 0 || remaining > 0)) {
            throw IntegrityError("trailing bytes after compressed chunk");
        }
    }

    if (!stream_end) {
        throw IntegrityError("compressed chunk ended early");
    }
}

void decode_compressed_payload(std::istream& frame, PayloadSink& sink) {
    std::vector<char> in_buf(DECODE_BUF_SIZE);
    std::vector<char> out_buf(DECODE_BUF_SIZE);
    while (sink.produced < sink.expected) {
        decode_chunk_record(frame, sink, in_buf, out_buf);
        if (sink.progress) sink.progress(sink.produced);
    }
}

} // namespace

FrameHeader decode_frame(std::istream& frame, std::ostream& out,
                         const ByteProgress& progress) {
    FrameHeader header = parse_header(read_record(frame, "header"));

    PayloadSink sink(out, progress, header.size);
    if (header.compressed) {
        decode_compressed_payload(frame, sink);
    } else {
        decode_plain_payload(frame, sink);
    }

    FrameFooter footer = parse_footer(read_record(frame, "footer"));
    if (frame.peek() != std::char_traits<char>::eof()) {
        throw FrameError("trailing data after footer");
    }

    uint32_t crc = sink.crc.value();
    Digest256 sha = sink.sha.finish();
    if (crc != footer.crc32) {
        throw IntegrityError(fmt::format("{}: crc32 mismatch (stored {:08x}, computed {:08x})",
                                         header.path, footer.crc32, crc));
    }
    if (sha != footer.sha256) {
        throw IntegrityError(fmt::format("{}: sha256 mismatch (stored {}, computed {})",
                                         header.path, digest_to_hex(footer.sha256),
                                         digest_to_hex(sha)));
    }

    out.flush();
    return header;
}

FrameInfo inspect_frame(std::istream& frame) {
    FrameInfo info;
    info.header = parse_header(read_record(frame, "header"));

    if (info.header.compressed) {
        // Chunk records and the footer share the [u32 length][bytes] shape;
        // the footer is the record that ends exactly at end of frame.
        std::streampos payload_start = frame.tellg();
        frame.seekg(0, std::ios::end);
        std::streampos end = frame.tellg();
        if (payload_start < 0 || end < 0) {
            throw FrameError("inspect requires a seekable frame");
        }
        frame.seekg(payload_start);

        while (true) {
            std::streampos here = frame.tellg();
            uint32_t len = 0;
            if (!read_u32_be(frame, len)) {
                throw FrameError("truncated frame: missing footer");
            }
            std::streamoff after = static_cast<std::streamoff>(here) + 4 + len;
            if (after == static_cast<std::streamoff>(end)) {
                frame.seekg(here);
                break;
            }
            if (after > static_cast<std::streamoff>(end)) {
                throw FrameError("chunk record runs past end of frame");
            }
            frame.seekg(after);
            info.payload_bytes += 4 + len;
        }
    } else {
        frame.seekg(static_cast<std::streamoff>(info.header.size), std::ios::cur);
        if (!frame) {
            throw FrameError("truncated frame: payload shorter than declared size");
        }
        info.payload_bytes = info.header.size;
    }

    info.footer = parse_footer(read_record(frame, "footer"));
    return info;
}

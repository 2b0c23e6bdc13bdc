//
// Chunk construction, serialization and the verifying parser
//

#include <algorithm>
#include <limits>
#include <ostream>
#include <sstream>
#include <utility>

#include <pngchunk/chunk.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>
#include "byte_reader.hh"

namespace pngchunk {

    namespace {
        constexpr std::uint64_t max_field_length = std::numeric_limits<std::uint32_t>::max();

        // Returns the offset of the first byte that does not start a well formed
        // UTF-8 sequence, or size if the whole range is valid. Overlong forms,
        // surrogates and code points above U+10FFFF are rejected.
        std::size_t find_invalid_utf8(const std::uint8_t* s, std::size_t size) {
            std::size_t i = 0;
            while (i < size) {
                std::uint8_t c = s[i];
                if (c < 0x80) {
                    i++;
                    continue;
                }

                std::size_t need;
                std::uint8_t lo = 0x80;
                std::uint8_t hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) {
                    need = 1;
                } else if (c >= 0xE0 && c <= 0xEF) {
                    need = 2;
                    if (c == 0xE0) lo = 0xA0;
                    if (c == 0xED) hi = 0x9F;
                } else if (c >= 0xF0 && c <= 0xF4) {
                    need = 3;
                    if (c == 0xF0) lo = 0x90;
                    if (c == 0xF4) hi = 0x8F;
                } else {
                    return i;
                }

                if (size - i <= need) {
                    return i;
                }
                // Only the first continuation byte has a narrowed range
                if (s[i + 1] < lo || s[i + 1] > hi) {
                    return i;
                }
                for (std::size_t k = 2; k <= need; k++) {
                    if ((s[i + k] & 0xC0) != 0x80) {
                        return i;
                    }
                }
                i += need + 1;
            }
            return size;
        }

        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::uint8_t> data)
        : m_length(0),
          m_type(type),
          m_data(std::move(data)),
          m_crc(0) {
        THROW_CHUNK_IF(m_data.size() > max_field_length, max_length_error, m_data.size(), max_field_length);
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = compute_crc(m_type, m_data);
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::uint8_t> data, std::uint32_t crc)
        : m_length(length),
          m_type(type),
          m_data(std::move(data)),
          m_crc(crc) {}

    std::uint32_t chunk::compute_crc(const chunk_type& type, const std::vector<std::uint8_t>& data) {
        const auto& tag = type.bytes();
        std::uint32_t crc = crc32(tag.data(), tag.size());
        return crc32_update(crc, data.data(), data.size());
    }

    chunk chunk::from_bytes(const std::uint8_t* data, std::size_t size) {
        return from_bytes(data, size, parse_options{});
    }

    chunk chunk::from_bytes(const std::vector<std::uint8_t>& raw) {
        return from_bytes(raw.data(), raw.size(), parse_options{});
    }

    chunk chunk::from_bytes(const std::vector<std::uint8_t>& raw,
                            const parse_options& options,
                            std::size_t* consumed) {
        return from_bytes(raw.data(), raw.size(), options, consumed);
    }

    chunk chunk::from_bytes(const std::uint8_t* data, std::size_t size,
                            const parse_options& options,
                            std::size_t* consumed) {
        byte_reader reader(data, size);

        // Length
        std::uint32_t length = reader.read_be32();
        THROW_CHUNK_IF(length > options.max_length, max_length_error, length, options.max_length);

        // Type
        const std::uint64_t type_offset = reader.tell();
        auto tag = reader.read_array4();
        auto type = [&tag]() {
            try {
                return chunk_type(tag);
            } catch (const chunk_type_error& e) {
                THROW_CHUNK(invalid_chunk_type, e.what());
            }
        }();

        if (!type.is_valid()) {
            THROW_CHUNK_IF(options.strict_type, invalid_chunk_type,
                           build_error_msg("reserved bit of '", type, "' is set"));
            warn(options, type_offset, "reserved_bit",
                 build_error_msg("Chunk type '", type, "' has the reserved bit set, accepted in non-strict mode"));
        }

        // Payload
        auto payload = reader.read_exact(length);
        THROW_CHUNK_IF(payload.size() != length, invalid_chunk_data, payload.size(), length);

        // Checksum
        std::uint32_t provided_crc = reader.read_be32();
        std::uint32_t true_crc = compute_crc(type, payload);
        THROW_CHUNK_IF(provided_crc != true_crc, invalid_crc, provided_crc, true_crc);

        if (reader.remaining() > 0) {
            warn(options, reader.tell(), "trailing_data",
                 build_error_msg("Ignoring ", reader.remaining(), " bytes after chunk '", type,
                                 "' of length ", length));
        }
        if (consumed) {
            *consumed = reader.tell();
        }

        return chunk(length, type, std::move(payload), provided_crc);
    }

    std::string chunk::data_as_string() const {
        std::size_t bad = find_invalid_utf8(m_data.data(), m_data.size());
        THROW_CHUNK_IF(bad != m_data.size(), decode_error, bad);
        return {m_data.begin(), m_data.end()};
    }

    std::vector<std::uint8_t> chunk::as_bytes() const {
        std::vector<std::uint8_t> out(overhead + m_data.size());
        std::uint8_t* p = out.data();

        store_be32(p, m_length);
        p += length_size;

        const auto& tag = m_type.bytes();
        std::copy(tag.begin(), tag.end(), p);
        p += type_size;

        std::copy(m_data.begin(), m_data.end(), p);
        p += m_data.size();

        store_be32(p, m_crc);
        return out;
    }

    std::string chunk::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length &&
               m_type == o.m_type &&
               m_crc == o.m_crc &&
               m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n"
           << "  Length: " << c.length() << "\n"
           << "  Type: " << c.type() << "\n"
           << "  Data: " << c.data().size() << " bytes\n"
           << "  Crc: " << c.crc() << "\n"
           << "}\n";
        return os;
    }

} // namespace pngchunk

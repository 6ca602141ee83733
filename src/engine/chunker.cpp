#include "chunker.hpp"
#include "semsearch/error.hpp"
#include <algorithm>
#include <cctype>

namespace semsearch::engine {

    namespace {

        const char* const kSeparators[] = { "\n\n", "\n", ". ", "! ", "? ", " " };

        inline bool is_continuation(char c) {
            return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
        }

        inline bool is_space(char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

    }

    Chunker::Chunker(ChunkerOptions options) : m_options(options) {
        if (m_options.chunk_size == 0) {
            throw Error(ErrorKind::InvalidConfiguration, "chunk_size must be positive");
        }
        if (m_options.overlap >= m_options.chunk_size) {
            throw Error(ErrorKind::InvalidConfiguration,
                        "overlap (" + std::to_string(m_options.overlap) + ") must be smaller than chunk_size (" +
                        std::to_string(m_options.chunk_size) + ")");
        }
    }

    std::vector<Chunk> Chunker::split(const Document& document) const {
        return split(document.text, document.id);
    }

    std::vector<Chunk> Chunker::split(const std::string& text, const std::string& source) const {
        std::vector<Chunk> chunks;
        if (text.empty()) return chunks;

        size_t start = 0;
        while (true) {
            size_t end = find_end(text, start);

            Chunk chunk;
            chunk.index = chunks.size();
            chunk.content = text.substr(start, end - start);
            chunk.source = source;
            chunk.start_offset = start;
            chunk.end_offset = end;
            chunks.push_back(std::move(chunk));

            if (end == text.size()) break;
            start = next_start(text, start, end);
        }

        return chunks;
    }

    size_t Chunker::find_end(const std::string& text, size_t start) const {
        const size_t size = m_options.chunk_size;
        if (text.size() - start <= size) return text.size();

        const size_t limit = start + size;
        const size_t min_end = start + std::max<size_t>(1, size / 2);

        for (const char* sep : kSeparators) {
            const std::string separator(sep);
            if (limit < start + separator.size()) continue;

            size_t pos = text.rfind(separator, limit - separator.size());
            if (pos != std::string::npos && pos >= start && pos + separator.size() >= min_end) {
                return pos + separator.size();
            }
        }

        // Hard cut, backed off to a UTF-8 sequence boundary.
        size_t end = limit;
        while (end > start && is_continuation(text[end])) --end;
        return end == start ? limit : end;
    }

    size_t Chunker::next_start(const std::string& text, size_t start, size_t end) const {
        if (m_options.overlap == 0) return end;

        size_t candidate = end - std::min(m_options.overlap, end);
        for (size_t p = candidate; p < end; ++p) {
            if (p > 0 && is_space(text[p - 1]) && !is_space(text[p])) {
                candidate = p;
                break;
            }
        }
        while (candidate < end && is_continuation(text[candidate])) ++candidate;

        return candidate <= start ? end : candidate;
    }

}

#pragma once

/// @file stream.hpp
/// @author Aleksandr Loshkarev
/// @brief Drivers that feed a parser from memory, chunk lists, streams and files.
///
/// Provides:
///   - drive()        : feed a parser from a chunk callback until it settles
///   - parse_all()    : one buffer followed by end of input
///   - parse_chunks() : a sequence of chunks followed by end of input
///   - parse_stream() : std::istream read in fixed-size chunks
///   - parse_file()   : file read in fixed-size chunks
///   - ChunkStream    : runs several parsers in turn over one chunk source,
///                      handing each one's leftover to the next
///
/// Only the current chunk and the tokenizer's partial token are held in
/// memory, so a file of any size is read with bounded buffering.
///
/// @code
///   auto out = sjson::parse_file(sjson::navigate_to(sjson::parse_path("items[3]")), "big.json");
///   if (out.failed()) std::cerr << out.failure().to_string() << '\n';
/// @endcode

#include "config.hpp"
#include "engine.hpp"
#include "error.hpp"

#include <cstddef>
#include <fstream>
#include <functional>
#include <istream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sjson {

// =====================================================================
// drive
// =====================================================================

/// @brief Feed `first`, then keep asking `next_chunk` while the parser needs more.
///
/// `next_chunk` returns a std::string_view that stays valid until the next
/// call; an empty view ends the input. When `first` is empty the first chunk
/// is fetched from `next_chunk` as well, since feeding it would end the input.
template <typename T, typename NextChunk>
[[nodiscard]] Outcome<T> drive(const Parser<T>& parser, std::string_view first,
                               NextChunk&& next_chunk) {
    Outcome<T> out = parser.feed(first.empty() ? std::string_view(next_chunk()) : first);
    while (out.need_more()) out = out.feed(std::string_view(next_chunk()));
    return out;
}

/// @brief Parse a complete in-memory document. The leftover is a suffix of `data`.
template <typename T>
[[nodiscard]] Outcome<T> parse_all(const Parser<T>& parser, std::string_view data) {
    return drive(parser, data, []() { return std::string_view{}; });
}

/// @brief Parse a document delivered as a sequence of chunks.
///
/// Empty chunks in the sequence are skipped, since an empty chunk is the end
/// of input marker. The leftover points into `chunks`.
template <typename T, typename Chunks>
[[nodiscard]] Outcome<T> parse_chunks(const Parser<T>& parser, const Chunks& chunks) {
    auto it = std::begin(chunks);
    auto end = std::end(chunks);
    auto next = [&]() -> std::string_view {
        while (it != end) {
            std::string_view chunk(*it++);
            if (!chunk.empty()) return chunk;
        }
        return {};
    };
    return drive(parser, std::string_view{}, next);
}

// =====================================================================
// Reader
// =====================================================================

namespace detail {

/// Reads fixed-size chunks from an istream into one reused buffer.
class ChunkReader {
public:
    ChunkReader(std::istream& is, size_t chunk_size)
        : is_(is), buffer_(chunk_size > 0 ? chunk_size : size_t(SJSON_DEFAULT_CHUNK_SIZE), '\0') {}

    /// False on a read error; an empty chunk means end of input.
    bool next(std::string_view& chunk) {
        if (eof_) {
            chunk = {};
            return true;
        }
        is_.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        const auto n = static_cast<size_t>(is_.gcount());
        if (SJSON_UNLIKELY(is_.bad())) return false;
        if (n == 0) eof_ = true;
        offset_ += n;
        chunk = std::string_view(buffer_.data(), n);
        return true;
    }

    [[nodiscard]] Failure failure() const {
        SourceLocation loc;
        loc.offset = offset_;
        return Failure{loc, "read error after " + std::to_string(offset_) + " bytes",
                       make_error_code(errc::io_error)};
    }

private:
    std::istream& is_;
    std::string buffer_;
    size_t offset_ = 0;
    bool eof_ = false;
};

template <typename T>
Outcome<T> read_through(const Parser<T>& parser, ChunkReader& reader) {
    std::string_view chunk;
    if (SJSON_UNLIKELY(!reader.next(chunk))) return Outcome<T>::failed_with(reader.failure());
    Outcome<T> out = parser.feed(chunk);
    while (out.need_more()) {
        if (SJSON_UNLIKELY(!reader.next(chunk))) return Outcome<T>::failed_with(reader.failure());
        out = out.feed(chunk);
    }
    // The leftover points into the reader's buffer.
    return out.detached();
}

} // namespace detail

// =====================================================================
// Streams and files
// =====================================================================

/// @brief Parse from an input stream read `chunk_size` bytes at a time.
///
/// A read error yields a failed outcome with errc::io_error. The leftover
/// of a done outcome is not kept, as it referred to the read buffer.
template <typename T>
[[nodiscard]] Outcome<T> parse_stream(const Parser<T>& parser, std::istream& is,
                                      size_t chunk_size = SJSON_DEFAULT_CHUNK_SIZE) {
    detail::ChunkReader reader(is, chunk_size);
    return detail::read_through(parser, reader);
}

/// @brief Parse a file read `chunk_size` bytes at a time.
///
/// A file that cannot be opened yields a failed outcome with errc::io_error.
template <typename T>
[[nodiscard]] Outcome<T> parse_file(const Parser<T>& parser, const std::string& path,
                                    size_t chunk_size = SJSON_DEFAULT_CHUNK_SIZE) {
    std::ifstream file(path, std::ios::binary);
    if (SJSON_UNLIKELY(!file.is_open())) {
        return Outcome<T>::failed_with(Failure{SourceLocation{}, "cannot open file: " + path,
                                               make_error_code(errc::io_error)});
    }
    return parse_stream(parser, file, chunk_size);
}

// =====================================================================
// ChunkStream
// =====================================================================

/// @brief Runs parsers one after another over a single chunk source.
///
/// What a finished parser left unconsumed is fed to the next parser before
/// any new chunk is fetched, so a stream of concatenated documents can be
/// read one document per run().
///
/// @code
///   sjson::ChunkStream s({R"({"a":1} [)", "2]"});
///   auto first  = s.run(sjson::root().bind(...));
///   auto second = s.run(sjson::root().bind(...));
/// @endcode
class ChunkStream {
public:
    /// Returns the next chunk; an empty view ends the input.
    using Source = std::function<std::string_view()>;

    explicit ChunkStream(Source source) : source_(std::move(source)) {}

    explicit ChunkStream(std::vector<std::string> chunks) : owned_(std::move(chunks)) {}

    /// @brief Drive `parser` to completion or failure.
    ///
    /// The leftover of a done outcome stays valid for as long as this
    /// ChunkStream (or the external source's chunk) lives.
    template <typename T>
    [[nodiscard]] Outcome<T> run(const Parser<T>& parser) {
        std::string_view first = pending_;
        pending_ = {};
        Outcome<T> out = drive(parser, first, [this]() { return next(); });
        if (out.done()) pending_ = out.leftover();
        return out;
    }

    /// @brief Unconsumed bytes waiting for the next run().
    [[nodiscard]] std::string_view pending() const noexcept { return pending_; }

    /// @brief True once the source has reported the end of input.
    [[nodiscard]] bool ended() const noexcept { return ended_; }

    /// @brief True when nothing is pending and the source is exhausted.
    [[nodiscard]] bool exhausted() {
        if (!pending_.empty()) return false;
        if (ended_) return true;
        pending_ = next();
        return pending_.empty();
    }

private:
    std::string_view next() {
        if (ended_) return {};
        std::string_view chunk;
        if (source_) {
            chunk = source_();
        } else {
            while (index_ < owned_.size() && owned_[index_].empty()) ++index_;
            if (index_ < owned_.size()) chunk = owned_[index_++];
        }
        if (chunk.empty()) ended_ = true;
        return chunk;
    }

    Source source_;
    std::vector<std::string> owned_;
    size_t index_ = 0;
    std::string_view pending_;
    bool ended_ = false;
};

} // namespace sjson

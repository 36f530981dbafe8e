#ifndef TOKEN_ASSEMBLER_HPP
#define TOKEN_ASSEMBLER_HPP

#include "stt/stream_event.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Finalized segments in arrival order plus at most one trailing partial.
struct TranscriptState {
    std::vector<std::string> finalized;
    std::optional<std::string> partial;
    int wordCount = 0;              // over finalized text only
};

struct TranscriptStats {
    int64_t elapsedSeconds = 0;
    int wordCount = 0;
    uint64_t bytesSent = 0;
};

namespace transcript {

// (state, token) -> state. A partial replaces the trailing partial; a final
// is trimmed, given one trailing space and appended, and clears the partial.
// Finalized segments are never touched again.
TranscriptState reduce(TranscriptState state, const Token& token);

// Finalized text followed by the trailing partial, if any.
std::string render(const TranscriptState& state);

// Finalized text only.
std::string finalText(const TranscriptState& state);

int countWords(const std::string& text);

TranscriptStats stats(const TranscriptState& state, std::chrono::steady_clock::duration elapsed,
                      uint64_t bytesSent);

} // namespace transcript

// Owns the transcript of one session. apply() runs on the receive path;
// readers take snapshots.
class TokenAssembler {
public:
    void apply(const Token& token);
    void reset();

    TranscriptState snapshot() const;
    std::string render() const;

private:
    mutable std::mutex mutex_;
    TranscriptState state_;
};

#endif

#include "transcript/token_assembler.hpp"

#include <cctype>
#include <utility>

namespace transcript {

static std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace((unsigned char)text[begin])) ++begin;
    while (end > begin && std::isspace((unsigned char)text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

int countWords(const std::string& text) {
    int words = 0;
    bool inWord = false;
    for (char c : text) {
        if (std::isspace((unsigned char)c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    return words;
}

TranscriptState reduce(TranscriptState state, const Token& token) {
    if (!token.isFinal) {
        state.partial = token.text;
        return state;
    }

    const std::string text = trim(token.text);
    if (!text.empty()) state.finalized.push_back(text + " ");
    state.partial.reset();
    state.wordCount = countWords(finalText(state));
    return state;
}

std::string finalText(const TranscriptState& state) {
    std::string out;
    for (const auto& segment : state.finalized) out += segment;
    return out;
}

std::string render(const TranscriptState& state) {
    std::string out = finalText(state);
    if (state.partial) out += *state.partial;
    return out;
}

TranscriptStats stats(const TranscriptState& state, std::chrono::steady_clock::duration elapsed,
                      uint64_t bytesSent) {
    TranscriptStats s;
    s.elapsedSeconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    s.wordCount = state.wordCount;
    s.bytesSent = bytesSent;
    return s;
}

} // namespace transcript

void TokenAssembler::apply(const Token& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = transcript::reduce(std::move(state_), token);
}

void TokenAssembler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = TranscriptState();
}

TranscriptState TokenAssembler::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string TokenAssembler::render() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript::render(state_);
}

#pragma once
#include <cstddef>
#include <span>
#include <string>

namespace rtmlink {

// Reassembly arena for messages split across several frames.
// Holds data only while a message is open; take() copies the bytes out and empties the arena,
// which keeps its capacity for the next message.
class MessageAssembler {
public:
    // maxBytes == 0: no limit
    explicit MessageAssembler(std::size_t maxBytes = 0) : m_maxBytes(maxBytes) {}

    [[nodiscard]] bool open() const noexcept { return m_open; }
    [[nodiscard]] std::size_t size() const noexcept { return m_data.size(); }
    [[nodiscard]] std::size_t maxBytes() const noexcept { return m_maxBytes; }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_data.capacity(); }

    // false when the chunk would push the message past maxBytes; the arena is left unchanged
    [[nodiscard]] bool append(std::span<const char> chunk) {
        if (!fits(m_data.size(), chunk.size())) return false;
        m_data.append(chunk.data(), chunk.size());
        m_open = true;
        return true;
    }

    [[nodiscard]] std::string take() {
        std::string out(m_data);
        m_data.clear();
        m_open = false;
        return out;
    }

    void clear() noexcept {
        m_data.clear();
        m_open = false;
    }

    // Single-frame message check, for frames that never enter the arena
    [[nodiscard]] bool fits(std::size_t held, std::size_t extra) const noexcept {
        return m_maxBytes == 0 || (held <= m_maxBytes && extra <= m_maxBytes - held);
    }

private:
    std::string m_data;
    std::size_t m_maxBytes;
    bool m_open{false};
};

} // namespace rtmlink

#pragma once

#include "bar_state.hpp"
#include "style.hpp"
#include <memory>
#include <optional>
#include <string>
#include <cstdint>

namespace avance {

namespace render {
class BarRegistry;
}

namespace core {

namespace detail {

// Owned jointly by every copy of a handle. The last copy to go away finishes the bar.
struct BarOwner {
    std::shared_ptr<render::BarRegistry> registry;
    std::shared_ptr<BarState> state;

    ~BarOwner();
};

}

// Cheap, copyable handle to one registered bar. Copies share the bar and may
// be used from any thread. A moved-from handle is detached: updates on it are
// ignored, lifecycle calls throw InvalidStateError(HANDLE_DETACHED).
class ProgressBar {
public:
    // Registers with the process-wide registry unless one is given.
    // Throws ConfigError for an invalid style.
    explicit ProgressBar(std::optional<uint64_t> total,
                         const std::string& description = "",
                         const StyleConfig& style = StyleConfig(),
                         std::shared_ptr<render::BarRegistry> registry = nullptr);

    // New bar with the style and registry of other.
    static ProgressBar likeOf(const ProgressBar& other,
                              std::optional<uint64_t> total,
                              const std::string& description = "");

    void update(uint64_t delta);
    void inc() { update(1); }
    void set(uint64_t value);

    void finish();
    void reset();

    void setDescription(const std::string& description);
    void setPostfix(const std::string& postfix);

    format::BarSnapshot snapshot() const;
    uint64_t rowId() const;
    bool isFinished() const;
    const StyleConfig& style() const;
    std::optional<size_t> position() const;

    bool valid() const { return owner_ != nullptr; }

private:
    explicit ProgressBar(std::shared_ptr<detail::BarOwner> owner) : owner_(std::move(owner)) {}

    const detail::BarOwner& attached(const char* operation) const;

    std::shared_ptr<detail::BarOwner> owner_;
};

}}

#pragma once

#include "progress_bar.hpp"
#include <iterator>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace avance {
namespace core {

namespace detail {

template<typename Range, typename = void>
struct HasSize : std::false_type {};

template<typename Range>
struct HasSize<Range, std::void_t<decltype(std::size(std::declval<Range&>()))>> : std::true_type {};

}

// Forwards to the wrapped iterator and advances the bar once per increment.
template<typename Iterator>
class TrackedIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = typename std::iterator_traits<Iterator>::value_type;
    using difference_type = typename std::iterator_traits<Iterator>::difference_type;
    using pointer = typename std::iterator_traits<Iterator>::pointer;
    using reference = typename std::iterator_traits<Iterator>::reference;

    TrackedIterator(Iterator it, ProgressBar* bar) : it_(std::move(it)), bar_(bar) {}

    reference operator*() const { return *it_; }

    TrackedIterator& operator++() {
        ++it_;
        bar_->inc();
        return *this;
    }

    bool operator==(const TrackedIterator& other) const { return it_ == other.it_; }
    bool operator!=(const TrackedIterator& other) const { return it_ != other.it_; }

private:
    Iterator it_;
    ProgressBar* bar_;
};

// Range adaptor returned by track(). Holds the range by reference for lvalues
// and by value for temporaries. The bar finishes when the last handle to it goes away.
template<typename Range>
class ProgressRange {
public:
    ProgressRange(Range&& range, ProgressBar bar)
        : range_(std::forward<Range>(range)), bar_(std::move(bar)) {}

    auto begin() { return TrackedIterator<decltype(std::begin(range_))>(std::begin(range_), &bar_); }
    auto end() { return TrackedIterator<decltype(std::end(range_))>(std::end(range_), &bar_); }

    ProgressBar& bar() { return bar_; }

private:
    Range range_;
    ProgressBar bar_;
};

// Wraps any iterable in a bar. The total is the range's size when it has one.
template<typename Range>
ProgressRange<Range> track(Range&& range,
                           const std::string& description = "",
                           const StyleConfig& style = StyleConfig(),
                           std::shared_ptr<render::BarRegistry> registry = nullptr) {
    std::optional<uint64_t> total;
    if constexpr (detail::HasSize<std::remove_reference_t<Range>>::value) {
        total = static_cast<uint64_t>(std::size(range));
    }
    ProgressBar bar(total, description, style, std::move(registry));
    return ProgressRange<Range>(std::forward<Range>(range), std::move(bar));
}

}}

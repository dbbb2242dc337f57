#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <cstddef>

namespace avance {
namespace test {

// Replays the subset of ANSI the terminal sink emits (CUU, CUD, EL2, CR, LF)
// onto a grid of lines, so tests can compare what a terminal would show.
class ScreenEmulator {
public:
    void feed(const std::string& bytes) {
        size_t i = 0;
        while (i < bytes.size()) {
            char c = bytes[i];
            if (c == '\033' && i + 1 < bytes.size() && bytes[i + 1] == '[') {
                size_t j = i + 2;
                size_t n = 0;
                bool has_n = false;
                while (j < bytes.size() && bytes[j] >= '0' && bytes[j] <= '9') {
                    n = n * 10 + static_cast<size_t>(bytes[j] - '0');
                    has_n = true;
                    ++j;
                }
                if (j >= bytes.size()) break;
                if (!has_n) n = 1;
                switch (bytes[j]) {
                    case 'A': row_ = n > row_ ? 0 : row_ - n; break;
                    case 'B': row_ += n; break;
                    case 'K': line() = ""; break;
                    default: break;
                }
                i = j + 1;
                continue;
            }
            if (c == '\r') {
                col_ = 0;
            } else if (c == '\n') {
                ++row_;
                col_ = 0;
            } else {
                std::string& current = line();
                if (col_ < current.size()) {
                    current[col_] = c;
                } else {
                    current.push_back(c);
                }
                ++col_;
            }
            ++i;
        }
    }

    const std::vector<std::string>& lines() const { return lines_; }
    size_t cursorRow() const { return row_; }

    // Lines above the cursor; the block's last line is the one right above it.
    std::vector<std::string> visible() const {
        std::vector<std::string> out(lines_.begin(), lines_.begin() + std::min(row_, lines_.size()));
        return out;
    }

private:
    std::string& line() {
        if (lines_.size() <= row_) {
            lines_.resize(row_ + 1);
        }
        return lines_[row_];
    }

    std::vector<std::string> lines_;
    size_t row_ = 0;
    size_t col_ = 0;
};

}}

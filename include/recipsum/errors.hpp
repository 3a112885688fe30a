#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace recipsum {

// Malformed index bounds: begin > end, or end past the input.
class InvalidRange : public std::out_of_range {
public:
    InvalidRange(std::size_t begin, std::size_t end, std::size_t size)
        : std::out_of_range("invalid range [" + std::to_string(begin) + ", " +
                            std::to_string(end) + ") for input of size " +
                            std::to_string(size)),
          begin_(begin), end_(end), size_(size) {}

    std::size_t begin() const { return begin_; }
    std::size_t end() const { return end_; }
    std::size_t size() const { return size_; }

private:
    std::size_t begin_;
    std::size_t end_;
    std::size_t size_;
};

class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace recipsum

#pragma once

#include <stdexcept>
#include <string>

namespace litepub {

// Raised when a document cannot be read, parsed, written or packaged.
// The dispatcher turns it into a 500 response.
class ConversionError : public std::runtime_error {
public:
    explicit ConversionError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace litepub

#pragma once

#include "model/LabelErrors.hpp"

#include <cstddef>
#include <string>

namespace pattern
{

// Malformed placeholder or choice syntax. Nothing is cached for the pattern.
class PatternParseError : public labels::LabelError
{
public:
    PatternParseError(const std::string& message, std::size_t offset)
        : labels::LabelError(message + " at offset " + std::to_string(offset))
        , offset_(offset)
    {
    }

    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

// Missing argument, argument of the wrong kind, or no matching choice range.
class PatternFormatError : public labels::LabelError
{
public:
    using labels::LabelError::LabelError;
};

} // namespace pattern

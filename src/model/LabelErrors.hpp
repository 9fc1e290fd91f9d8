#pragma once

#include <stdexcept>
#include <string>

namespace labels
{

// Base of every error the engine throws.
class LabelError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The label store collaborator failed; never answered with an empty string.
class StoreUnavailableError : public LabelError
{
public:
    using LabelError::LabelError;
};

// Thrown by a store when a create raced with another writer. The engine
// retries once as a read.
class StoreWriteConflict : public LabelError
{
public:
    using LabelError::LabelError;
};

} // namespace labels

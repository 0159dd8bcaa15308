#pragma once

#include <stdexcept>
#include <string>

namespace cloudclip::store {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Latest item of an empty session, or end/status of an unknown id.
class NotFound : public StoreError {
public:
    using StoreError::StoreError;
};

// The code generator ran out of attempts without finding a free id.
class ExhaustedCodespace : public StoreError {
public:
    using StoreError::StoreError;
};

} // namespace cloudclip::store

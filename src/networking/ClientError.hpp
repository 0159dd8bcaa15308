#pragma once

#include <stdexcept>
#include <string>

namespace cloudclip::networking {

class ClientError : public std::runtime_error {
public:
    enum class Kind { Unreachable, Timeout, Protocol };

    ClientError(Kind kind, const std::string& what)
        : std::runtime_error(what),
          kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

} // namespace cloudclip::networking

#pragma once

#include <stdexcept>
#include <string>

namespace hush {

/// Raised while parsing or validating a configuration document.
/// Never escapes ConfigStore: a failed reload keeps the previous snapshot.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace hush

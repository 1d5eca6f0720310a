#ifndef VOTEFEE_ERROR_HPP
#define VOTEFEE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace votefee {

// Fee oracle rejected the parameters or the transaction shape,
// or the sample transactions produced an impossible fee model.
class oracle_failure
  : public std::runtime_error
{
public:
    explicit oracle_failure(const std::string& message)
      : std::runtime_error(message) {}
};

// Money arithmetic would have wrapped.
class arithmetic_error
  : public std::runtime_error
{
public:
    explicit arithmetic_error(const std::string& message)
      : std::runtime_error(message) {}
};

// Unreadable or malformed input file.
class config_error
  : public std::runtime_error
{
public:
    explicit config_error(const std::string& message)
      : std::runtime_error(message) {}
};

} // namespace votefee

#endif


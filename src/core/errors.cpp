#include <bse/core/errors.hpp>

#include <sstream>
#include <utility>

namespace bse {
namespace core {

namespace {

std::string invalid_parameter_message(const std::string& name, double value,
                                      const std::string& reason) {
  std::ostringstream os;
  os << "InvalidParameter: " << name << "=" << value << " (" << reason << ")";
  return os.str();
}

std::string parse_error_message(std::size_t index, const std::string& text,
                                const std::string& reason) {
  std::ostringstream os;
  os << "ParseError: argument " << index << " '" << text << "' (" << reason << ")";
  return os.str();
}

} // unnamed namespace

InvalidParameter::InvalidParameter(std::string name, double value, std::string reason)
  : std::invalid_argument(invalid_parameter_message(name, value, reason)),
    name_(std::move(name)), value_(value), reason_(std::move(reason)) {}

ParseError::ParseError(std::size_t index, std::string text, std::string reason)
  : std::runtime_error(parse_error_message(index, text, reason)),
    index_(index), text_(std::move(text)), reason_(std::move(reason)) {}

} // namespace core
} // namespace bse

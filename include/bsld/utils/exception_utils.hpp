#pragma once

#include <exception>
#include <string>

namespace bsld::utils {

// Message of the exception held by `error`; "unknown error" when it does not
// derive from std::exception
auto DescribeException(const std::exception_ptr& error) -> std::string;

}  // namespace bsld::utils

#include "bsld/utils/exception_utils.hpp"

namespace bsld::utils {

auto DescribeException(const std::exception_ptr& error) -> std::string {
  if (!error) {
    return "no error";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

}  // namespace bsld::utils

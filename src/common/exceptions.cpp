#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace dcx {
using namespace std;

dcx_exception::dcx_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *dcx_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const dcx_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : dcx_exception(message) {}

network_error::network_error(const string &message)
    : dcx_exception(message) {}

bad_request::bad_request(const string &code, const string &message)
    : dcx_exception(message), code(code) {}

not_found::not_found(const string &code, const string &message)
    : dcx_exception(message), code(code) {}

conflict::conflict(const string &message)
    : dcx_exception(message) {}

}  // namespace dcx

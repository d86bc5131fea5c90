#include "zatca/api/http_transport.h"

namespace zatca::api {

const char* httpMethodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:   return "GET";
        case HttpMethod::POST:  return "POST";
        case HttpMethod::PATCH: return "PATCH";
    }
    return "POST";
}

} // namespace zatca::api
